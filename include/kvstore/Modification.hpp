#ifndef MODIFICATION_HPP
#define MODIFICATION_HPP

#include <string>
#include <vector>
#include <variant>


struct DeleteModification {
  std::string key;
};

struct UpdateModification {
  std::string key;
  std::string value;
};

using Modification = std::variant<DeleteModification, UpdateModification>;

bool operator==(const DeleteModification& lhs, const DeleteModification& rhs);
bool operator==(const UpdateModification& lhs, const UpdateModification& rhs);

// Key touched by a modification, whichever kind it is
const std::string& modificationKey(const Modification& modification);

// Human readable form, e.g. "Update(a, 1)" or "Delete(a)"
std::string describe(const Modification& modification);


#endif // MODIFICATION_HPP
