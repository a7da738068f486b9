#ifndef SW_STRATEGY
#define SW_STRATEGY

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include "Frontier.hpp"

enum class Strategy { DepthFirst, BreadthFirst };

class UnknownStrategy : public std::invalid_argument {
    std::string strategy_name;

public:
    explicit UnknownStrategy(const std::string& name)
        : std::invalid_argument("Unknown traversal strategy: '" + name + "' (expected depth-first or breadth-first)"),
          strategy_name(name) {}

    const std::string& name() const noexcept { return strategy_name; }
};

using InsertionPolicy = void (Frontier::*)(std::string, std::size_t);

class StrategySelector {
    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

public:
    static Strategy resolve(const std::string& name) {
        const std::string key = lower(name);
        if (key == "depth-first" || key == "dfs") return Strategy::DepthFirst;
        if (key == "breadth-first" || key == "bfs") return Strategy::BreadthFirst;
        throw UnknownStrategy(name);
    }

    // No name means breadth-first.
    static Strategy resolveOrDefault(const std::optional<std::string>& name) {
        return name ? resolve(*name) : Strategy::BreadthFirst;
    }

    static InsertionPolicy insertionPolicy(const Strategy strategy) noexcept {
        switch (strategy) {
            case Strategy::DepthFirst: return &Frontier::pushDepthFirst;
            case Strategy::BreadthFirst: return &Frontier::pushBreadthFirst;
        }
        return &Frontier::pushBreadthFirst;
    }

    static const char* toString(const Strategy strategy) noexcept {
        return strategy == Strategy::DepthFirst ? "depth-first" : "breadth-first";
    }
};

#endif
