#include "kvstore/Modification.hpp"
#include <type_traits>

bool operator==(const DeleteModification& lhs, const DeleteModification& rhs) {
    return lhs.key == rhs.key;
}

bool operator==(const UpdateModification& lhs, const UpdateModification& rhs) {
    return lhs.key == rhs.key && lhs.value == rhs.value;
}

const std::string& modificationKey(const Modification& modification) {
    return std::visit([](const auto& mod) -> const std::string& {
        return mod.key;
    }, modification);
}

std::string describe(const Modification& modification) {
    return std::visit([](const auto& mod) -> std::string {
        using ModType = std::decay_t<decltype(mod)>;

        if constexpr (std::is_same_v<ModType, DeleteModification>) {
            return "Delete(" + mod.key + ")";
        }
        else if constexpr (std::is_same_v<ModType, UpdateModification>) {
            return "Update(" + mod.key + ", " + mod.value + ")";
        }
        else {
            static_assert(sizeof(ModType) == 0, "Unhandled modification type in describe");
        }
    }, modification);
}
