// Claro.hpp
#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include "Types.hpp"
#include "Tokens.hpp"
#include "Program.hpp"
#include "Config.hpp"

// Result of executing one statement or a range of statements.
// Control signals travel as values instead of interpreter-wide flags.
struct Outcome {
    enum class Kind {
        NEXT,           // Continue at next_index
        LOOP_BREAK,
        LOOP_CONTINUE,
        RETURN,
        EXIT,
        RAISED          // Details are in the Error module
    };

    Kind kind = Kind::NEXT;
    size_t next_index = 0;
    uint32_t line_number = 0;   // Line the outcome originated from

    static Outcome next(size_t index, uint32_t line) { return { Kind::NEXT, index, line }; }
    static Outcome signal(Kind kind, size_t index, uint32_t line) { return { kind, index, line }; }
    static Outcome raised(uint32_t line) { return { Kind::RAISED, 0, line }; }

    bool is_next() const { return kind == Kind::NEXT; }
};

class ClaroInterpreter {
public:
    struct FunctionInfo {
        std::string name;
        std::vector<std::string> parameter_names;
        LineSequence body;
        uint32_t line_number = 0;   // Line of the FUNC statement
    };

    using FunctionTable = std::unordered_map<std::string, FunctionInfo>;

    struct StackFrame {
        std::string function_name;
        uint32_t linenr = 0;        // Line of the CALL
    };

    // Reads one line of input after showing a prompt; nullopt at end of input.
    using LineReader = std::function<std::optional<std::string>(const std::string&)>;

    // --- Member Variables (Global State) ---
    Environment variables;              // Global environment
    FunctionTable function_table;
    std::vector<std::string> output;    // Output of the current run, flushed by the host
    std::vector<StackFrame> call_stack;
    InterpreterConfig config;
    bool debug_mode = false;
    LineReader line_reader;

    // The sequence and environment the dispatcher is working on. A call
    // switches both to the function body and its frame environment.
    const LineSequence* active_lines = nullptr;
    Environment* active_env = nullptr;

    ClaroInterpreter();

    // Applies a loaded configuration: limits, debug flag, locale, globals.
    void apply_config(const InterpreterConfig& new_config);

    // --- Execution engine ---
    Outcome statement(size_t index);
    Outcome execute_range(size_t begin, size_t end);
    Outcome execute_function(const FunctionInfo& func, const std::vector<ClaroValue>& args, uint32_t call_line);

    // --- Program driver ---
    bool run_program(const LineSequence& lines);
    bool run_source(const std::string& source);
    bool run_file(const std::string& path);
    void flush_output();

    // Interactive loop; returns when the user types exit or input ends.
    void start();
    void print_help() const;

    // Helpers for statement handlers.
    const SourceLine& line_at(size_t index) const { return (*active_lines)[index]; }
    ClaroValue evaluate(const std::string& expr, uint32_t line_number);
};
