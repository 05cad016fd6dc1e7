#include "pytestify/core/call_site.hpp"
#include "pytestify/core/python_source.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <iterator>
#include <map>

namespace pytestify {

namespace {

constexpr size_t FIRST_ARGUMENT_GROUP = 4;

auto is_statement_tail(std::string_view tail) -> bool {
    auto trimmed = python::trim(tail);
    return trimmed.empty() || trimmed.front() == '#';
}

} // namespace

auto CallArguments::keyword(std::string_view name) const -> std::optional<std::string> {
    for (const auto& [key, value] : keywords) {
        if (key == name) {
            return value;
        }
    }
    return std::nullopt;
}

auto CallArguments::has_star_arguments() const -> bool {
    return std::any_of(positional.begin(), positional.end(),
                       [](const std::string& argument) { return argument.starts_with('*'); });
}

auto make_call_matcher(std::vector<std::string> callees) -> RuleMatcher {
    return [callees = std::move(callees)](std::string_view text) -> std::vector<MatchSpan> {
        std::vector<MatchSpan> spans;
        auto mask = python::code_mask(text);
        auto lines = python::split_logical_lines(text);

        // Statement starts, keyed by the offset of their first code character
        std::map<size_t, const python::LogicalLine*> statement_starts;
        for (const auto& line : lines) {
            if (line.is_statement()) {
                statement_starts.emplace(line.code_begin, &line);
            }
        }

        for (const auto& callee : callees) {
            auto pos = text.find(callee);
            while (pos != std::string_view::npos) {
                auto next = pos + 1;
                bool boundary_before = pos == 0 || (!python::is_identifier_char(text[pos - 1]) &&
                                                    text[pos - 1] != '.');
                auto open = pos + callee.size();
                while (open < text.size() && (text[open] == ' ' || text[open] == '\t')) {
                    ++open;
                }

                if (boundary_before && mask[pos] && open < text.size() && text[open] == '(') {
                    if (auto close = python::find_closing_bracket(text, open)) {
                        MatchSpan span{.begin = pos, .end = *close + 1, .groups = {}};

                        auto line_it = statement_starts.upper_bound(pos);
                        const python::LogicalLine* line = nullptr;
                        if (line_it != statement_starts.begin()) {
                            line = std::prev(line_it)->second;
                        }
                        bool statement = false;
                        std::string indent;
                        if (line != nullptr) {
                            indent = line->indent;
                            auto line_content_end = line->code_begin + line->code.size();
                            statement = line->code_begin == pos && *close < line_content_end &&
                                        is_statement_tail(text.substr(
                                            *close + 1, line_content_end - *close - 1));
                        }

                        span.groups.emplace_back(std::string(text.substr(pos, span.length())));
                        span.groups.emplace_back(indent);
                        span.groups.emplace_back(callee);
                        span.groups.emplace_back(statement ? "statement" : "expression");
                        for (auto& argument :
                             python::split_top_level(text.substr(open + 1, *close - open - 1))) {
                            span.groups.emplace_back(std::move(argument));
                        }
                        spans.push_back(std::move(span));
                        next = *close + 1;
                    }
                }
                pos = text.find(callee, next);
            }
        }
        return spans;
    };
}

auto decode_call(const Captures& captures) -> std::optional<CallArguments> {
    if (captures.size() < FIRST_ARGUMENT_GROUP || !captures[1] || !captures[2] || !captures[3]) {
        return std::nullopt;
    }

    CallArguments call;
    call.indent = *captures[1];
    call.callee = *captures[2];
    call.whole_statement = *captures[3] == "statement";
    for (size_t index = FIRST_ARGUMENT_GROUP; index < captures.size(); ++index) {
        if (!captures[index]) {
            return std::nullopt;
        }
        const auto& argument = *captures[index];
        if (auto keyword = python::keyword_argument(argument)) {
            call.keywords.push_back(std::move(*keyword));
        } else if (!call.keywords.empty() && !argument.starts_with("**")) {
            return std::nullopt;  // Positional argument after a keyword
        } else {
            call.positional.push_back(argument);
        }
    }
    return call;
}

auto make_call_producer(CallRewriter rewriter) -> RuleProducer {
    return [rewriter = std::move(rewriter)](const Captures& captures) -> std::optional<std::string> {
        auto call = decode_call(captures);
        if (!call || !call->whole_statement) {
            return std::nullopt;
        }
        for (size_t index = FIRST_ARGUMENT_GROUP; index < captures.size(); ++index) {
            if (python::has_top_level_line_break(*captures[index])) {
                return std::nullopt;
            }
        }
        return rewriter(*call);
    };
}

} // namespace pytestify
