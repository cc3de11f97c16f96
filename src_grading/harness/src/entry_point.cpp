// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Cortex Lattice contributors

#include "cortex_grading/entry_point.hpp"
#include "cortex_grading/errors.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

using cortex::grading::Symbol;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string_view trim_view(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return input.substr(begin, end - begin + 1);
}

const Symbol* callable_named(const std::vector<Symbol>& symbols, std::string_view name) {
    const auto it = std::find_if(symbols.begin(), symbols.end(), [&](const Symbol& symbol) {
        return symbol.name == name;
    });
    if (it == symbols.end() || !it->callable) {
        return nullptr;
    }
    return &*it;
}

}  // namespace

namespace cortex::grading {

std::vector<std::string> hinted_function_names(std::string_view starter_code) {
    std::vector<std::string> names;
    while (!starter_code.empty()) {
        const auto newline = starter_code.find('\n');
        const auto line = trim_view(starter_code.substr(0, newline));
        starter_code.remove_prefix(newline == std::string_view::npos ? starter_code.size()
                                                                     : newline + 1);

        if (line.rfind("def ", 0) != 0) {
            continue;
        }
        auto name = trim_view(line.substr(4, line.find('(') - 4));
        if (!name.empty()) {
            names.emplace_back(name);
        }
    }
    return names;
}

std::optional<std::string> select_entry_point(std::string_view starter_code,
                                              const std::vector<Symbol>& symbols,
                                              const std::vector<std::string>& fallback_names) {
    for (const auto& name : hinted_function_names(starter_code)) {
        if (callable_named(symbols, name) != nullptr) {
            return name;
        }
    }

    for (const auto& name : fallback_names) {
        if (callable_named(symbols, name) != nullptr) {
            return name;
        }
    }

    for (const auto& symbol : symbols) {
        if (symbol.callable && !symbol.builtin && symbol.name.rfind('_', 0) != 0) {
            return symbol.name;
        }
    }

    return std::nullopt;
}

EntryPointResolver::EntryPointResolver(Config config) : config_{std::move(config)} {}

const Symbol& EntryPointResolver::resolve(const std::optional<std::string>& hint,
                                          const CandidateNamespace& ns) const {
    const auto selected =
        select_entry_point(hint.value_or(std::string{}), ns.symbols(), config_.fallback_names);
    if (!selected) {
        throw EntryPointNotFoundError{};
    }

    const auto* symbol = ns.find(*selected);
    if (symbol == nullptr || !symbol->handle) {
        throw EntryPointNotFoundError{};
    }
    spdlog::debug("entry point resolved to '{}'", symbol->name);
    return *symbol;
}

}  // namespace cortex::grading
