// The single translation unit that compiles the TooManyCooks implementation.
#define TMC_IMPL

#include "tmc/all_headers.hpp"
#include "tmc/asio/ex_asio.hpp"
