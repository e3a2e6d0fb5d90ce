#ifndef MAIN_HPP
#define MAIN_HPP

#include <atomic>

#include "config.hpp"

extern std::atomic_bool interrupted;

// Sample configuration written by --genconf
NASCPGlobalConf sampleConfig();

#endif
