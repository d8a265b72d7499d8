// Claro.cpp
#include "Claro.hpp"
#include "Commands.hpp"
#include "ExpressionEvaluator.hpp"
#include "BuiltinFunctions.hpp"
#include "LocaleManager.hpp"
#include "Statements.hpp"
#include "StringUtils.hpp"
#include "TextIO.hpp"
#include "Error.hpp"

ClaroInterpreter::ClaroInterpreter() {
    active_lines = nullptr;
    active_env = &variables;
    // Console input: show pending output before the prompt appears.
    line_reader = [this](const std::string& prompt) {
        flush_output();
        return TextIO::read_line(prompt);
        };
}

void ClaroInterpreter::apply_config(const InterpreterConfig& new_config) {
    config = new_config;
    debug_mode = config.debug;
    if (!config.locale.empty()) {
        LocaleManager::set_current_locale(config.locale);
    }
    for (auto& [key, value] : config.globals.items()) {
        variables[key] = json_to_claro_value(value);
    }
}

ClaroValue ClaroInterpreter::evaluate(const std::string& expr, uint32_t line_number) {
    return ExpressionEvaluator::evaluate(expr, *active_env, line_number);
}

Outcome ClaroInterpreter::statement(size_t index) {
    const SourceLine& line = line_at(index);
    if (debug_mode) {
        TextIO::debug(line.line_number, line.text);
    }

    switch (line.keyword) {
    case Tokens::ID::PRINT:
        return Commands::do_print(*this, index);
    case Tokens::ID::VARIABLE:
    case Tokens::ID::SET:
        return Commands::do_variable(*this, index);
    case Tokens::ID::STRTYPE:
        return Commands::do_string(*this, index);
    case Tokens::ID::LIST:
        return Commands::do_list(*this, index);
    case Tokens::ID::DICT:
        return Commands::do_dict(*this, index);
    case Tokens::ID::INPUT:
        return Commands::do_input(*this, index);
    case Tokens::ID::GET:
        return Commands::do_get(*this, index);
    case Tokens::ID::CONCAT:
        return Commands::do_concat(*this, index);
    case Tokens::ID::IF:
        return Commands::do_if(*this, index);
    case Tokens::ID::ELSE:
        return Commands::do_else(*this, index);
    case Tokens::ID::WHILE:
        return Commands::do_while(*this, index);
    case Tokens::ID::FOR:
        return Commands::do_for(*this, index);
    case Tokens::ID::REPEAT:
        return Commands::do_repeat(*this, index);
    case Tokens::ID::BREAK:
        return Commands::do_break(*this, index);
    case Tokens::ID::CONTINUE:
        return Commands::do_continue(*this, index);
    case Tokens::ID::FUNC:
        return Commands::do_func(*this, index);
    case Tokens::ID::CALL:
        return Commands::do_call(*this, index);
    case Tokens::ID::RETURN:
        return Commands::do_return(*this, index);
    case Tokens::ID::TRY:
        return Commands::do_try(*this, index);
    case Tokens::ID::STACK:
        return Commands::do_stack(*this, index);
    case Tokens::ID::TRACE:
        return Commands::do_trace(*this, index);
    case Tokens::ID::DEBUG:
        return Commands::do_debug(*this, index);
    case Tokens::ID::EXIT:
        return Commands::do_exit(*this, index);
    case Tokens::ID::END:
        return Commands::do_end(*this, index);
    case Tokens::ID::COMMENT:
        return Outcome::next(index + 1, line.line_number);
    case Tokens::ID::EXCEPT:
    case Tokens::ID::FINALLY:
        Error::set(Error::INVALID_STATEMENT, line.line_number, line.keyword_text + " outside of TRY");
        return Outcome::raised(line.line_number);
    default:
        Error::set(Error::INVALID_STATEMENT, line.line_number, "Unknown statement '" + line.keyword_text + "'");
        return Outcome::raised(line.line_number);
    }
}

Outcome ClaroInterpreter::execute_range(size_t begin, size_t end) {
    size_t pc = begin;
    uint32_t last_line = 0;
    while (pc < end) {
        Outcome outcome = statement(pc);
        if (!outcome.is_next()) {
            return outcome;
        }
        last_line = outcome.line_number;
        pc = outcome.next_index;
    }
    return Outcome::next(end, last_line);
}

Outcome ClaroInterpreter::execute_function(const FunctionInfo& func, const std::vector<ClaroValue>& args, uint32_t call_line) {
    if (call_stack.size() >= static_cast<size_t>(config.recursion_limit)) {
        Error::set(Error::RECURSION_LIMIT, call_line,
            func.name + " exceeded " + std::to_string(config.recursion_limit) + " nested calls");
        return Outcome::raised(call_line);
    }

    // Copy-in: the frame starts with everything the caller can see.
    Environment frame_env = *active_env;
    for (size_t i = 0; i < func.parameter_names.size(); ++i) {
        frame_env[func.parameter_names[i]] = args[i];
    }

    // --- Context switch to the function body ---
    const LineSequence* caller_lines = active_lines;
    Environment* caller_env = active_env;
    active_lines = &func.body;
    active_env = &frame_env;
    call_stack.push_back({ func.name, call_line });

    Outcome outcome = execute_range(0, func.body.size());

    call_stack.pop_back();
    active_lines = caller_lines;
    active_env = caller_env;

    switch (outcome.kind) {
    case Outcome::Kind::LOOP_BREAK:
    case Outcome::Kind::LOOP_CONTINUE:
        Error::set(Error::CONTROL_SIGNAL_OUTSIDE_LOOP, outcome.line_number,
            outcome.kind == Outcome::Kind::LOOP_BREAK ? "BREAK" : "CONTINUE");
        return Outcome::raised(outcome.line_number);
    case Outcome::Kind::RAISED:
        // The caller's variables stay as they were.
        return outcome;
    default:
        break;
    }

    // Merge-out: the frame's bindings overwrite the caller's.
    for (const auto& pair : frame_env) {
        (*active_env)[pair.first] = pair.second;
    }
    if (outcome.kind == Outcome::Kind::EXIT) return outcome;
    return Outcome::next(0, call_line);
}

bool ClaroInterpreter::run_program(const LineSequence& lines) {
    Error::clear();
    output.clear();
    call_stack.clear();

    const LineSequence* saved_lines = active_lines;
    active_lines = &lines;
    active_env = &variables;

    Outcome outcome = execute_range(0, lines.size());

    active_lines = saved_lines;

    if (outcome.kind == Outcome::Kind::LOOP_BREAK || outcome.kind == Outcome::Kind::LOOP_CONTINUE) {
        Error::set(Error::CONTROL_SIGNAL_OUTSIDE_LOOP, outcome.line_number,
            outcome.kind == Outcome::Kind::LOOP_BREAK ? "BREAK" : "CONTINUE");
    }
    return Error::get() == 0;
}

bool ClaroInterpreter::run_source(const std::string& source) {
    LineSequence lines = Program::parse(source);
    return run_program(lines);
}

bool ClaroInterpreter::run_file(const std::string& path) {
    Error::clear();
    LineSequence lines;
    if (!Program::load_file(path, lines)) {
        Error::print();
        return false;
    }
    bool ok = run_program(lines);
    flush_output();
    if (!ok) {
        Error::print();
    }
    return ok;
}

void ClaroInterpreter::flush_output() {
    for (const auto& text : output) {
        TextIO::print(text);
        TextIO::nl();
    }
    output.clear();
}

void ClaroInterpreter::print_help() const {
    TextIO::print(
        "Available statements:\n"
        "  PRINT <expr>                       - Print a value\n"
        "  VARIABLE|SET <name> = <expr>       - Assign a variable\n"
        "  STRING|LIST|DICT <name> = <expr>   - Assign a typed value\n"
        "  GET <name>                         - Show a variable\n"
        "  INPUT <name> [prompt]              - Read a line into a variable\n"
        "  CONCAT <dest> <a> <b>              - Join two variables as text\n"
        "  IF <cond> ... [ELSE ...] END       - Conditional block\n"
        "  WHILE <cond> ... END               - Loop while true\n"
        "  FOR <v> IN <expr> ... END          - Loop over a list, dict or string\n"
        "  FOR <v> = <a> TO <b> [STEP <s>] ... END\n"
        "  REPEAT <n> <statement>             - Run a statement n times\n"
        "  BREAK / CONTINUE                   - Leave or restart the innermost loop\n"
        "  FUNC <name> [params] ... END       - Define a function\n"
        "  CALL <name> a, b  |  CALL <name>(a, b) - Call a function\n"
        "                                       (arguments containing spaces need commas\n"
        "                                        or parentheses: CALL f(n - 1))\n"
        "  RETURN [expr]                      - Leave a function, setting RETVAL\n"
        "  TRY ... EXCEPT ... FINALLY ... END - Handle errors (ERR, ERL, ERRMSG)\n"
        "  STACK / TRACE                      - Show call stack / variables and functions\n"
        "  DEBUG ON|OFF                       - Trace each executed line\n"
        "  EXIT                               - Stop the program\n"
        "Type 'exit' to leave the interpreter.\n");
}

void ClaroInterpreter::start() {
    TextIO::print("Claro Interpreter Version 1.0\n");
    TextIO::print("Type 'help' for commands, 'exit' to quit.\n");

    uint32_t session_line = 1;
    while (true) {
        std::optional<std::string> input = line_reader(config.prompt);
        if (!input) break;

        std::string first = StringUtils::trimmed(*input);
        if (first.empty()) continue;
        const std::string command = StringUtils::to_upper(first);
        if (command == "EXIT" || command == "QUIT") break;
        if (command == "HELP") {
            print_help();
            continue;
        }

        // Keep reading while a block is still open.
        std::string chunk = first + "\n";
        uint32_t chunk_lines = 1;
        int depth = 0;
        SourceLine opener = Program::make_line(first, session_line);
        if (Statements::opens_block(opener.keyword)) depth++;
        else if (opener.keyword == Tokens::ID::END) depth--;
        while (depth > 0) {
            std::optional<std::string> more = line_reader("... ");
            if (!more) break;
            chunk += *more + "\n";
            chunk_lines++;
            SourceLine next = Program::make_line(*more, session_line);
            if (Statements::opens_block(next.keyword)) depth++;
            else if (next.keyword == Tokens::ID::END) depth--;
        }

        LineSequence lines = Program::parse(chunk, session_line);
        session_line = static_cast<uint32_t>(session_line + chunk_lines);

        bool ok = run_program(lines);
        flush_output();
        if (!ok) {
            Error::print();
            Error::clear();
        }
    }
}
