#ifndef INCLUDE_POLYRUN_LOGGER_H_
#define INCLUDE_POLYRUN_LOGGER_H_

// Keep the console sinks usable in children forked while another thread is logging
void InitLogger();

#endif  // INCLUDE_POLYRUN_LOGGER_H_
