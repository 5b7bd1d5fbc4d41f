#include "replication/ProtoConvert.hpp"
#include <stdexcept>
#include <type_traits>

void toProto(const Modification& modification, kvsync::Modification* out) {
    std::visit([out](const auto& mod) {
        using ModType = std::decay_t<decltype(mod)>;

        if constexpr (std::is_same_v<ModType, DeleteModification>) {
            out->mutable_delete_op()->set_key(mod.key);
        }
        else if constexpr (std::is_same_v<ModType, UpdateModification>) {
            auto* update = out->mutable_update_op();
            update->set_key(mod.key);
            update->set_value(mod.value);
        }
        else {
            static_assert(sizeof(ModType) == 0, "Unhandled modification type in toProto");
        }
    }, modification);
}

Modification fromProto(const kvsync::Modification& message) {
    switch (message.kind_case()) {
        case kvsync::Modification::kDeleteOp:
            return DeleteModification{message.delete_op().key()};

        case kvsync::Modification::kUpdateOp:
            return UpdateModification{message.update_op().key(), message.update_op().value()};

        case kvsync::Modification::KIND_NOT_SET:
        default:
            throw std::invalid_argument("Modification has no kind set");
    }
}

void toProto(const std::vector<Modification>& modifications,
             google::protobuf::RepeatedPtrField<kvsync::Modification>* out) {
    out->Reserve(static_cast<int>(modifications.size()));
    for (const auto& modification : modifications) {
        toProto(modification, out->Add());
    }
}

std::vector<Modification> fromProto(
    const google::protobuf::RepeatedPtrField<kvsync::Modification>& messages) {
    std::vector<Modification> modifications;
    modifications.reserve(messages.size());
    for (const auto& message : messages) {
        modifications.push_back(fromProto(message));
    }
    return modifications;
}
