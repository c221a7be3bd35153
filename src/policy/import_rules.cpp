#include "policy/import_rules.hpp"

#include <spdlog/spdlog.h>

ImportDecision check_import(const ValidatorPolicy&          policy,
                            std::string_view                module,
                            const std::vector<std::string>& symbols,
                            int                             level) {
    ImportDecision decision{};

    if (level > 0) {
        decision.offending = std::string(static_cast<std::size_t>(level), '.') + std::string{module};
        decision.reason    = fmt::format("relative import '{}' is not allowed", decision.offending);
        return decision;
    }

    const auto it = policy.allowed_imports.find(std::string{module});
    if (module.empty() || it == policy.allowed_imports.end()) {
        decision.offending = std::string{module};
        decision.reason    = fmt::format("import of module '{}' is not allowed", module);
        return decision;
    }

    const ImportRule& rule = it->second;
    if (!rule.allows_all()) {
        for (const auto& symbol : symbols) {
            if (rule.symbols->count(symbol) == 0) {
                decision.offending = std::string{module};
                decision.reason    = fmt::format(
                    "import of '{}' from module '{}' is not allowed", symbol, module);
                return decision;
            }
        }
    }

    decision.allowed = true;
    return decision;
}
