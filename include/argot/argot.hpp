#ifndef ARGOT_ARGOT_HPP
#define ARGOT_ARGOT_HPP

#include "arg.hpp"
#include "argfile.hpp"
#include "command.hpp"
#include "config.hpp"
#include "convert.hpp"
#include "errors.hpp"
#include "interpreter.hpp"
#include "range.hpp"
#include "result.hpp"
#include "trace.hpp"
#include "utils.hpp"
#include "value.hpp"

#endif // ARGOT_ARGOT_HPP
