#pragma once

#include "pytestify/core/transformation_rule.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pytestify {

// Decoded arguments of one matched call
struct CallArguments {
    std::string indent;
    std::string callee;
    std::vector<std::string> positional;
    std::vector<std::pair<std::string, std::string>> keywords;
    bool whole_statement = false;

    auto keyword(std::string_view name) const -> std::optional<std::string>;
    auto has_star_arguments() const -> bool;
};

using CallRewriter = std::function<std::optional<std::string>(const CallArguments& call)>;

// Matches calls to any of the callee names, outside strings and comments.
// Captures: [0] callee through closing parenthesis, [1] indentation of the
// logical line, [2] callee, [3] "statement" or "expression", [4..] arguments.
auto make_call_matcher(std::vector<std::string> callees) -> RuleMatcher;

auto decode_call(const Captures& captures) -> std::optional<CallArguments>;

// Declines calls that are not whole statements or whose arguments span
// several lines outside brackets; everything else goes to the rewriter
auto make_call_producer(CallRewriter rewriter) -> RuleProducer;

} // namespace pytestify
