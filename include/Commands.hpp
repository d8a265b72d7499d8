// Commands.hpp
#pragma once
#include "Types.hpp"
#include <string>
#include <cstddef>

class ClaroInterpreter; // Forward declaration to avoid circular dependencies
struct Outcome;

// One handler per statement keyword. Each receives the index of its line
// in the active sequence and returns where execution goes next.
namespace Commands {
    Outcome do_print(ClaroInterpreter& vm, size_t index);
    Outcome do_variable(ClaroInterpreter& vm, size_t index);
    Outcome do_string(ClaroInterpreter& vm, size_t index);
    Outcome do_list(ClaroInterpreter& vm, size_t index);
    Outcome do_dict(ClaroInterpreter& vm, size_t index);
    Outcome do_input(ClaroInterpreter& vm, size_t index);
    Outcome do_get(ClaroInterpreter& vm, size_t index);
    Outcome do_concat(ClaroInterpreter& vm, size_t index);

    Outcome do_if(ClaroInterpreter& vm, size_t index);
    Outcome do_else(ClaroInterpreter& vm, size_t index);
    Outcome do_while(ClaroInterpreter& vm, size_t index);
    Outcome do_for(ClaroInterpreter& vm, size_t index);
    Outcome do_repeat(ClaroInterpreter& vm, size_t index);
    Outcome do_break(ClaroInterpreter& vm, size_t index);
    Outcome do_continue(ClaroInterpreter& vm, size_t index);

    Outcome do_func(ClaroInterpreter& vm, size_t index);
    Outcome do_call(ClaroInterpreter& vm, size_t index);
    Outcome do_return(ClaroInterpreter& vm, size_t index);

    Outcome do_try(ClaroInterpreter& vm, size_t index);

    Outcome do_stack(ClaroInterpreter& vm, size_t index);
    Outcome do_trace(ClaroInterpreter& vm, size_t index);
    Outcome do_debug(ClaroInterpreter& vm, size_t index);
    Outcome do_exit(ClaroInterpreter& vm, size_t index);
    Outcome do_end(ClaroInterpreter& vm, size_t index);
}

// Looks a name up in the active environment; nullptr if unbound.
const ClaroValue* get_variable(ClaroInterpreter& vm, const std::string& name);
void set_variable(ClaroInterpreter& vm, const std::string& name, const ClaroValue& value);
