#ifndef INCLUDE_CODEMATIC_LOGGER_H_
#define INCLUDE_CODEMATIC_LOGGER_H_

// 0 = warn, 1 = info, 2+ = debug
void InitLogger(int verbosity);

#endif  // INCLUDE_CODEMATIC_LOGGER_H_
