// Commands.cpp
#include "Commands.hpp"
#include "Claro.hpp"
#include "BlockResolver.hpp"
#include "BuiltinFunctions.hpp"
#include "ExpressionEvaluator.hpp"
#include "Statements.hpp"
#include "StringUtils.hpp"
#include "Error.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

namespace {
    Outcome fail(uint8_t code, const SourceLine& line, const std::string& message) {
        Error::set(code, line.line_number, message);
        return Outcome::raised(line.line_number);
    }

    // Length of the identifier at the start of s (0 if none).
    size_t identifier_length(const std::string& s) {
        if (s.empty() || !(StringUtils::isletter(s[0]) || s[0] == '_')) return 0;
        size_t len = 1;
        while (len < s.size() && (StringUtils::isletter(s[len]) || StringUtils::isdigit(s[len]) || s[len] == '_')) len++;
        return len;
    }

    // True if s is "( ... )" with the first '(' closed by the last ')'.
    bool wrapped_in_parens(const std::string& s) {
        if (s.size() < 2 || s.front() != '(' || s.back() != ')') return false;
        int depth = 0;
        char quote = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (quote) { if (c == quote) quote = 0; continue; }
            if (c == '"' || c == '\'') { quote = c; continue; }
            if (c == '(') depth++;
            else if (c == ')') {
                depth--;
                if (depth == 0 && i != s.size() - 1) return false;
            }
        }
        return depth == 0;
    }

    // Splits a name off the front: "add(a, b)" -> {"add", "(a, b)"}, "add a b" -> {"add", "a b"}.
    std::pair<std::string, std::string> split_name(const std::string& args) {
        std::string text = StringUtils::trimmed(args);
        size_t len = identifier_length(text);
        return { text.substr(0, len), StringUtils::trimmed(text.substr(len)) };
    }

    // Parses "name = expr" or the legacy "name expr".
    bool parse_assignment(const std::string& args, std::string& name, std::string& expr) {
        auto parts = split_name(args);
        name = parts.first;
        const std::string& rest = parts.second;
        if (name.empty() || rest.empty()) return false;
        // A name followed by anything other than whitespace or '=' is malformed ("a[0] = 1").
        const std::string text = StringUtils::trimmed(args);
        if (name.size() < text.size() && !StringUtils::isspace(text[name.size()]) && text[name.size()] != '=') return false;

        if (rest[0] == '=' && (rest.size() < 2 || rest[1] != '=')) {
            expr = StringUtils::trimmed(rest.substr(1));
        }
        else {
            expr = rest;
        }
        return !expr.empty();
    }

    // Argument list of CALL, or parameter list of FUNC, after the name.
    std::vector<std::string> split_arguments(const std::string& text) {
        if (wrapped_in_parens(text)) {
            return StringUtils::split_top_level(text.substr(1, text.size() - 2), ',');
        }
        auto comma_parts = StringUtils::split_top_level(text, ',');
        if (comma_parts.size() > 1) return comma_parts;
        return StringUtils::split_top_level_words(text);
    }

    enum class PassResult { KEEP_GOING, STOP, PROPAGATE };

    // Runs one pass over a loop body and consumes BREAK/CONTINUE.
    PassResult run_loop_pass(ClaroInterpreter& vm, size_t begin, size_t end, Outcome& propagated) {
        Outcome pass = vm.execute_range(begin, end);
        switch (pass.kind) {
        case Outcome::Kind::NEXT:
        case Outcome::Kind::LOOP_CONTINUE:
            return PassResult::KEEP_GOING;
        case Outcome::Kind::LOOP_BREAK:
            return PassResult::STOP;
        default:
            propagated = pass;
            return PassResult::PROPAGATE;
        }
    }

    Outcome for_in(ClaroInterpreter& vm, size_t index, size_t end, const std::string& var, const std::string& expr) {
        const SourceLine& line = vm.line_at(index);
        ClaroValue iterable = vm.evaluate(expr, line.line_number);
        if (Error::get() != 0) return Outcome::raised(line.line_number);

        // Snapshot the items so the body may reassign the iterable.
        std::vector<ClaroValue> items;
        if (std::holds_alternative<std::shared_ptr<Array>>(iterable)) {
            items = std::get<std::shared_ptr<Array>>(iterable)->data;
        }
        else if (std::holds_alternative<std::shared_ptr<Map>>(iterable)) {
            for (const auto& pair : std::get<std::shared_ptr<Map>>(iterable)->data) items.push_back(pair.first);
        }
        else if (std::holds_alternative<std::string>(iterable)) {
            for (char c : std::get<std::string>(iterable)) items.push_back(std::string(1, c));
        }
        else {
            return fail(Error::NOT_ITERABLE, line, "cannot iterate over a " + type_name(iterable));
        }

        for (const auto& item : items) {
            set_variable(vm, var, item);
            Outcome propagated;
            PassResult result = run_loop_pass(vm, index + 1, end, propagated);
            if (result == PassResult::STOP) break;
            if (result == PassResult::PROPAGATE) return propagated;
        }
        return Outcome::next(end + 1, line.line_number);
    }

    Outcome for_to(ClaroInterpreter& vm, size_t index, size_t end, const std::string& var, const std::string& range_text) {
        const SourceLine& line = vm.line_at(index);
        size_t to_pos = StringUtils::find_top_level_word(range_text, "TO");
        if (to_pos == std::string::npos) {
            return fail(Error::MISSING_ARGUMENT, line, "Usage: FOR var = start TO end [STEP step]");
        }
        std::string start_expr = StringUtils::trimmed(range_text.substr(0, to_pos));
        std::string rest = range_text.substr(to_pos + 2);
        std::string stop_expr = rest;
        std::string step_expr;
        size_t step_pos = StringUtils::find_top_level_word(rest, "STEP");
        if (step_pos != std::string::npos) {
            stop_expr = rest.substr(0, step_pos);
            step_expr = StringUtils::trimmed(rest.substr(step_pos + 4));
            if (step_expr.empty()) return fail(Error::MISSING_ARGUMENT, line, "STEP needs a value");
        }
        stop_expr = StringUtils::trimmed(stop_expr);
        if (start_expr.empty() || stop_expr.empty()) {
            return fail(Error::MISSING_ARGUMENT, line, "Usage: FOR var = start TO end [STEP step]");
        }

        ClaroValue start_val = vm.evaluate(start_expr, line.line_number);
        if (Error::get() != 0) return Outcome::raised(line.line_number);
        ClaroValue stop_val = vm.evaluate(stop_expr, line.line_number);
        if (Error::get() != 0) return Outcome::raised(line.line_number);
        ClaroValue step_val = 1LL;
        if (!step_expr.empty()) {
            step_val = vm.evaluate(step_expr, line.line_number);
            if (Error::get() != 0) return Outcome::raised(line.line_number);
        }
        for (const ClaroValue* v : { &start_val, &stop_val, &step_val }) {
            if (!is_numeric(*v)) {
                return fail(Error::TYPE_MISMATCH, line, "FOR bounds must be numbers, got " + type_name(*v));
            }
        }
        if (to_double(step_val) == 0.0) {
            return fail(Error::MISSING_ARGUMENT, line, "STEP must not be zero");
        }

        const bool integral = !std::holds_alternative<double>(start_val) &&
            !std::holds_alternative<double>(stop_val) && !std::holds_alternative<double>(step_val);
        if (integral) {
            const long long stop = to_integer(stop_val);
            const long long step = to_integer(step_val);
            for (long long i = to_integer(start_val); step > 0 ? i <= stop : i >= stop;) {
                set_variable(vm, var, i);
                Outcome propagated;
                PassResult result = run_loop_pass(vm, index + 1, end, propagated);
                if (result == PassResult::STOP) break;
                if (result == PassResult::PROPAGATE) return propagated;
                // Stepping past the integer range ends the loop.
                if (!checked_add(i, step, i)) break;
            }
        }
        else {
            const double stop = to_double(stop_val);
            const double step = to_double(step_val);
            for (double d = to_double(start_val); step > 0 ? d <= stop : d >= stop; d += step) {
                set_variable(vm, var, d);
                Outcome propagated;
                PassResult result = run_loop_pass(vm, index + 1, end, propagated);
                if (result == PassResult::STOP) break;
                if (result == PassResult::PROPAGATE) return propagated;
            }
        }
        return Outcome::next(end + 1, line.line_number);
    }
} // end anonymous namespace

const ClaroValue* get_variable(ClaroInterpreter& vm, const std::string& name) {
    auto it = vm.active_env->find(name);
    if (it == vm.active_env->end()) return nullptr;
    return &it->second;
}

void set_variable(ClaroInterpreter& vm, const std::string& name, const ClaroValue& value) {
    (*vm.active_env)[name] = value;
}

Outcome Commands::do_print(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    if (line.args.empty()) {
        return fail(Error::MISSING_ARGUMENT, line, "PRINT requires an expression");
    }
    ClaroValue result = vm.evaluate(line.args, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);
    vm.output.push_back(to_string(result));
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_variable(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    std::string name, expr;
    if (!parse_assignment(line.args, name, expr)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: " + StringUtils::to_upper(line.keyword_text) + " name = expression");
    }
    ClaroValue value = vm.evaluate(expr, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);
    set_variable(vm, name, value);
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_string(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    std::string name, expr;
    if (!parse_assignment(line.args, name, expr)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: STRING name = expression");
    }
    ClaroValue value = vm.evaluate(expr, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);
    set_variable(vm, name, to_string(value));
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_list(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    std::string name, expr;
    if (!parse_assignment(line.args, name, expr)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: LIST name = [items]");
    }
    ClaroValue value = vm.evaluate(expr, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);
    if (!std::holds_alternative<std::shared_ptr<Array>>(value)) {
        return fail(Error::TYPE_MISMATCH, line, "LIST expects a list, got " + type_name(value));
    }
    set_variable(vm, name, value);
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_dict(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    std::string name, entries;
    if (!parse_assignment(line.args, name, entries)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: DICT name = key: value, ...");
    }
    if (entries.front() != '{') {
        entries = "{" + entries + "}";
    }
    ClaroValue value = vm.evaluate(entries, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);
    if (!std::holds_alternative<std::shared_ptr<Map>>(value)) {
        return fail(Error::TYPE_MISMATCH, line, "DICT expects a dict, got " + type_name(value));
    }
    set_variable(vm, name, value);
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_input(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    auto parts = StringUtils::split_first_word(line.args);
    const std::string& name = parts.first;
    if (!StringUtils::is_identifier(name)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: INPUT name [prompt]");
    }

    // A quoted prompt is an expression; anything else is shown as written.
    std::string prompt = parts.second;
    if (!prompt.empty() && (prompt[0] == '"' || prompt[0] == '\'')) {
        ClaroValue prompt_val = vm.evaluate(prompt, line.line_number);
        if (Error::get() != 0) return Outcome::raised(line.line_number);
        prompt = to_string(prompt_val);
    }
    if (!prompt.empty() && prompt.back() != ' ') prompt += ' ';

    std::optional<std::string> input;
    if (vm.line_reader) input = vm.line_reader(prompt);
    set_variable(vm, name, input.value_or(std::string("")));
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_get(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    const std::string name = StringUtils::trimmed(line.args);
    if (!StringUtils::is_identifier(name)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: GET name");
    }
    const ClaroValue* value = get_variable(vm, name);
    if (value) {
        vm.output.push_back(name + " = " + to_string(*value));
    }
    else {
        vm.output.push_back("Variable '" + name + "' is not defined.");
    }
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_concat(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    auto names = StringUtils::split_top_level_words(line.args);
    if (names.size() != 3 || !std::all_of(names.begin(), names.end(), StringUtils::is_identifier)) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: CONCAT dest a b");
    }
    std::string result;
    for (size_t i = 1; i < names.size(); ++i) {
        const ClaroValue* value = get_variable(vm, names[i]);
        if (value) result += to_string(*value);
    }
    set_variable(vm, names[0], result);
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_if(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    std::string condition = line.args;
    // Accept the optional trailing THEN.
    auto words = StringUtils::split_top_level_words(condition);
    if (!words.empty() && StringUtils::to_upper(words.back()) == "THEN") {
        condition = StringUtils::trimmed(condition.substr(0, condition.size() - words.back().size()));
    }
    if (condition.empty()) {
        return fail(Error::MISSING_ARGUMENT, line, "IF requires a condition");
    }

    size_t target = BlockResolver::find_else_or_close(*vm.active_lines, index);
    if (target == BlockResolver::NOT_FOUND) return Outcome::raised(line.line_number);

    ClaroValue result = vm.evaluate(condition, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);

    if (to_bool(result)) {
        return Outcome::next(index + 1, line.line_number);
    }
    // False: the ELSE body runs next, or execution moves on to END.
    if (vm.line_at(target).keyword == Tokens::ID::ELSE) {
        return Outcome::next(target + 1, line.line_number);
    }
    return Outcome::next(target, line.line_number);
}

Outcome Commands::do_else(ClaroInterpreter& vm, size_t index) {
    // Only reached by falling out of a true branch: skip the ELSE body.
    const SourceLine& line = vm.line_at(index);
    size_t end = BlockResolver::find_close(*vm.active_lines, index);
    if (end == BlockResolver::NOT_FOUND) return Outcome::raised(line.line_number);
    return Outcome::next(end, line.line_number);
}

Outcome Commands::do_while(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    if (line.args.empty()) {
        return fail(Error::MISSING_ARGUMENT, line, "WHILE requires a condition");
    }
    size_t end = BlockResolver::find_close(*vm.active_lines, index);
    if (end == BlockResolver::NOT_FOUND) return Outcome::raised(line.line_number);

    while (true) {
        ClaroValue condition = vm.evaluate(line.args, line.line_number);
        if (Error::get() != 0) return Outcome::raised(line.line_number);
        if (!to_bool(condition)) break;

        Outcome propagated;
        PassResult result = run_loop_pass(vm, index + 1, end, propagated);
        if (result == PassResult::STOP) break;
        if (result == PassResult::PROPAGATE) return propagated;
    }
    return Outcome::next(end + 1, line.line_number);
}

Outcome Commands::do_for(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    size_t end = BlockResolver::find_close(*vm.active_lines, index);
    if (end == BlockResolver::NOT_FOUND) return Outcome::raised(line.line_number);

    // --- FOR var IN iterable ---
    size_t in_pos = StringUtils::find_top_level_word(line.args, "IN");
    if (in_pos != std::string::npos) {
        std::string var = StringUtils::trimmed(line.args.substr(0, in_pos));
        std::string expr = StringUtils::trimmed(line.args.substr(in_pos + 2));
        if (!StringUtils::is_identifier(var) || expr.empty()) {
            return fail(Error::MISSING_ARGUMENT, line, "Usage: FOR var IN iterable");
        }
        return for_in(vm, index, end, var, expr);
    }

    // --- FOR var = start TO end [STEP step] ---
    size_t eq_pos = line.args.find('=');
    if (eq_pos != std::string::npos) {
        std::string var = StringUtils::trimmed(line.args.substr(0, eq_pos));
        if (StringUtils::is_identifier(var)) {
            return for_to(vm, index, end, var, line.args.substr(eq_pos + 1));
        }
    }
    return fail(Error::MISSING_ARGUMENT, line, "Usage: FOR var IN iterable or FOR var = start TO end");
}

Outcome Commands::do_repeat(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    auto parts = StringUtils::split_first_word(line.args);
    if (parts.first.empty() || parts.second.empty()) {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: REPEAT count statement");
    }
    ClaroValue count_val = vm.evaluate(parts.first, line.line_number);
    if (Error::get() != 0) return Outcome::raised(line.line_number);
    if (!std::holds_alternative<long long>(count_val) || std::get<long long>(count_val) <= 0) {
        return fail(Error::MISSING_ARGUMENT, line, "REPEAT count must be a positive integer");
    }

    // The repeated statement runs as a one-line sequence of its own.
    LineSequence single = { Program::make_line(parts.second, line.line_number) };
    const Tokens::ID keyword = single[0].keyword;
    if (Statements::opens_block(keyword) || keyword == Tokens::ID::ELSE || keyword == Tokens::ID::END ||
        keyword == Tokens::ID::EXCEPT || keyword == Tokens::ID::FINALLY) {
        return fail(Error::INVALID_STATEMENT, line, "REPEAT cannot run a block statement");
    }

    const long long count = std::get<long long>(count_val);
    const LineSequence* saved_lines = vm.active_lines;
    vm.active_lines = &single;
    Outcome outcome = Outcome::next(index + 1, line.line_number);
    for (long long i = 0; i < count; ++i) {
        Outcome pass = vm.statement(0);
        if (!pass.is_next()) {
            outcome = pass;
            break;
        }
    }
    vm.active_lines = saved_lines;
    return outcome;
}

Outcome Commands::do_break(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    return Outcome::signal(Outcome::Kind::LOOP_BREAK, vm.active_lines->size(), line.line_number);
}

Outcome Commands::do_continue(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    return Outcome::signal(Outcome::Kind::LOOP_CONTINUE, vm.active_lines->size(), line.line_number);
}

Outcome Commands::do_func(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    size_t end = BlockResolver::find_close(*vm.active_lines, index);
    if (end == BlockResolver::NOT_FOUND) return Outcome::raised(line.line_number);

    auto parts = split_name(line.args);
    const std::string& name = parts.first;
    if (name.empty()) {
        return fail(Error::FUNCTION_DEFINITION, line, "FUNC requires a name");
    }
    if (!parts.second.empty() && parts.second[0] != '(' && !StringUtils::isspace(StringUtils::trimmed(line.args)[name.size()])) {
        return fail(Error::FUNCTION_DEFINITION, line, "invalid function name");
    }

    ClaroInterpreter::FunctionInfo info;
    info.name = name;
    info.line_number = line.line_number;
    for (const auto& param : split_arguments(parts.second)) {
        if (!StringUtils::is_identifier(param)) {
            return fail(Error::FUNCTION_DEFINITION, line, "invalid parameter '" + param + "'");
        }
        if (std::find(info.parameter_names.begin(), info.parameter_names.end(), param) != info.parameter_names.end()) {
            return fail(Error::FUNCTION_DEFINITION, line, "duplicate parameter '" + param + "'");
        }
        info.parameter_names.push_back(param);
    }
    info.body.assign(vm.active_lines->begin() + index + 1, vm.active_lines->begin() + end);

    // Redefinition silently replaces the old function.
    vm.function_table[name] = std::move(info);
    return Outcome::next(end, line.line_number);
}

Outcome Commands::do_call(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    auto parts = split_name(line.args);
    const std::string& name = parts.first;
    if (name.empty()) {
        return fail(Error::MISSING_ARGUMENT, line, "CALL requires a function name");
    }

    auto it = vm.function_table.find(name);
    if (it == vm.function_table.end()) {
        return fail(Error::UNDEFINED_FUNCTION, line, name);
    }

    std::vector<std::string> arg_exprs = split_arguments(parts.second);
    // Copy: the body may redefine the function while it runs.
    const ClaroInterpreter::FunctionInfo func = it->second;
    if (arg_exprs.size() != func.parameter_names.size()) {
        return fail(Error::ARITY_MISMATCH, line, name + " expects " + std::to_string(func.parameter_names.size()) +
            " argument(s), got " + std::to_string(arg_exprs.size()));
    }

    std::vector<ClaroValue> args;
    for (const auto& expr : arg_exprs) {
        args.push_back(vm.evaluate(expr, line.line_number));
        if (Error::get() != 0) return Outcome::raised(line.line_number);
    }

    Outcome result = vm.execute_function(func, args, line.line_number);
    if (result.kind == Outcome::Kind::NEXT) {
        return Outcome::next(index + 1, line.line_number);
    }
    return result;
}

Outcome Commands::do_return(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    if (vm.call_stack.empty()) {
        return fail(Error::INVALID_STATEMENT, line, "RETURN outside of a function");
    }
    if (!line.args.empty()) {
        ClaroValue value = vm.evaluate(line.args, line.line_number);
        if (Error::get() != 0) return Outcome::raised(line.line_number);
        set_variable(vm, "RETVAL", value);
    }
    return Outcome::signal(Outcome::Kind::RETURN, vm.active_lines->size(), line.line_number);
}

Outcome Commands::do_try(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    BlockResolver::TrySections sections = BlockResolver::find_try_sections(*vm.active_lines, index);
    if (sections.end_index == BlockResolver::NOT_FOUND) return Outcome::raised(line.line_number);

    const size_t end = sections.end_index;
    const size_t finally_begin = sections.finally_index;
    const size_t try_end = sections.except_index != BlockResolver::NOT_FOUND ? sections.except_index
        : (finally_begin != BlockResolver::NOT_FOUND ? finally_begin : end);

    Outcome pending = vm.execute_range(index + 1, try_end);
    if (pending.kind == Outcome::Kind::RAISED) {
        const long long code = Error::get();
        const long long error_line = Error::line();
        const std::string message = Error::message();
        Error::clear();
        set_variable(vm, "ERR", code);
        set_variable(vm, "ERL", error_line);
        set_variable(vm, "ERRMSG", message);

        pending = Outcome::next(try_end, line.line_number);
        if (sections.except_index != BlockResolver::NOT_FOUND) {
            const size_t except_end = finally_begin != BlockResolver::NOT_FOUND ? finally_begin : end;
            pending = vm.execute_range(sections.except_index + 1, except_end);
        }
    }

    if (finally_begin != BlockResolver::NOT_FOUND) {
        // FINALLY runs with a clean error state; a pending error comes back afterwards.
        Error::State saved = Error::save();
        Error::clear();
        Outcome finally_outcome = vm.execute_range(finally_begin + 1, end);
        if (!finally_outcome.is_next()) return finally_outcome;
        Error::restore(saved);
    }

    if (!pending.is_next()) return pending;
    return Outcome::next(end, line.line_number);
}

Outcome Commands::do_stack(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    vm.output.push_back("Call Stack (depth " + std::to_string(vm.call_stack.size()) + "):");
    for (const auto& frame : vm.call_stack) {
        vm.output.push_back("  " + frame.function_name + " (called from line " + std::to_string(frame.linenr) + ")");
    }
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_trace(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    vm.output.push_back("---- TRACE ----");

    nlohmann::json vars = nlohmann::json::object();
    for (const auto& pair : *vm.active_env) {
        vars[pair.first] = claro_to_json_value(pair.second);
    }
    vm.output.push_back("Variables (" + std::to_string(vm.active_env->size()) + "): " + vars.dump());

    std::vector<std::string> names;
    for (const auto& pair : vm.function_table) names.push_back(pair.first);
    std::sort(names.begin(), names.end());
    vm.output.push_back("Functions (" + std::to_string(names.size()) + "):");
    for (const auto& name : names) {
        const auto& func = vm.function_table.at(name);
        std::string params;
        for (size_t i = 0; i < func.parameter_names.size(); ++i) {
            if (i > 0) params += ", ";
            params += func.parameter_names[i];
        }
        vm.output.push_back("  " + name + "(" + params + ") with " + std::to_string(func.body.size()) + " lines");
    }

    vm.output.push_back("---- END TRACE ----");
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_debug(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    const std::string mode = StringUtils::to_upper(StringUtils::trimmed(line.args));
    if (mode == "ON") {
        vm.debug_mode = true;
        vm.output.push_back("Debug mode enabled.");
    }
    else if (mode == "OFF") {
        vm.debug_mode = false;
        vm.output.push_back("Debug mode disabled.");
    }
    else {
        return fail(Error::MISSING_ARGUMENT, line, "Usage: DEBUG ON|OFF");
    }
    return Outcome::next(index + 1, line.line_number);
}

Outcome Commands::do_exit(ClaroInterpreter& vm, size_t index) {
    const SourceLine& line = vm.line_at(index);
    return Outcome::signal(Outcome::Kind::EXIT, vm.active_lines->size(), line.line_number);
}

Outcome Commands::do_end(ClaroInterpreter& vm, size_t index) {
    // Block-closing marker: step past it.
    return Outcome::next(index + 1, vm.line_at(index).line_number);
}
