#include "asmcmp/target.hpp"

#include "asmcmp/format.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace asmcmp::literals;

namespace asmcmp {

    std::string accepted_aliases() {
        std::vector<std::string> names{};
        names.reserve(all_target_aliases.size());
        for (auto alias : all_target_aliases) {
            names.emplace_back(to_string(alias));
        }
        return utils::join_with_separator(names, "|"sv);
    }

    unknown_alias_error::unknown_alias_error(std::string alias)
            : std::runtime_error{"unknown target alias: {} (expected {})"_format(alias, accepted_aliases())},
              alias_{std::move(alias)} {}

    extraction_request resolve_request(std::string_view alias, std::string function) {
        target_alias target{};
        if (!try_parse_target_alias(utils::trim_view(alias), target)) {
            throw unknown_alias_error{std::string{alias}};
        }
        if (utils::trim_view(function).empty()) {
            throw std::invalid_argument{"function identifier must be non-empty"};
        }
        return extraction_request{.function = std::move(function), .target = target};
    }

    std::vector<target_alias> resolve_targets(std::span<const std::string> aliases) {
        std::vector<target_alias> targets{};
        targets.reserve(aliases.size());
        for (const auto& alias : aliases) {
            target_alias target{};
            if (!try_parse_target_alias(utils::trim_view(alias), target)) {
                throw unknown_alias_error{alias};
            }
            targets.push_back(target);
        }
        return targets;
    }

}  // namespace asmcmp
