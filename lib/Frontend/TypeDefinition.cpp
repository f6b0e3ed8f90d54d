#include "llvmderive/Frontend/TypeDefinition.h"

#include <algorithm>
#include <limits>

namespace llvmderive {

bool TypeExpr::isQualified() const {
  return name.find("::") != std::string::npos;
}

std::string TypeExpr::str() const {
  std::string out = name;
  if (args.empty()) {
    return out;
  }
  out += '<';
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += args[i].str();
  }
  out += '>';
  return out;
}

bool TypeDefinition::hasGenericParam(const std::string &param) const {
  return std::find(generics.begin(), generics.end(), param) != generics.end();
}

const char *shapeKindName(const TypeShapeKind kind) {
  switch (kind) {
  case TypeShapeKind::TupleStruct:
    return "tuple_struct";
  case TypeShapeKind::Struct:
    return "struct";
  case TypeShapeKind::Enum:
    return "enum";
  case TypeShapeKind::Union:
    return "union";
  case TypeShapeKind::UnitStruct:
    return "unit_struct";
  }
  return "unknown";
}

std::vector<std::int64_t> effectiveDiscriminants(const TypeDefinition &def) {
  std::vector<std::int64_t> out;
  out.reserve(def.variants.size());
  std::int64_t next = 0;
  for (const auto &variant : def.variants) {
    const std::int64_t value = variant.discriminant.value_or(next);
    out.push_back(value);
    // Saturates so an implicit successor of the maximum shows up as a duplicate.
    next = (value == std::numeric_limits<std::int64_t>::max()) ? value : value + 1;
  }
  return out;
}

} // namespace llvmderive
