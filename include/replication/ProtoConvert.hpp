#ifndef PROTO_CONVERT_HPP
#define PROTO_CONVERT_HPP

#include "kvstore/Modification.hpp"
#include "kvsync.pb.h"

#include <google/protobuf/repeated_field.h>
#include <vector>

// Conversions between the C++ structs and the wire messages

void toProto(const Modification& modification, kvsync::Modification* out);

// Throws std::invalid_argument when no modification kind is set
Modification fromProto(const kvsync::Modification& message);

void toProto(const std::vector<Modification>& modifications,
             google::protobuf::RepeatedPtrField<kvsync::Modification>* out);

std::vector<Modification> fromProto(
    const google::protobuf::RepeatedPtrField<kvsync::Modification>& messages);

#endif // PROTO_CONVERT_HPP
