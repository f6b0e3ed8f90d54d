#ifndef LLVMDERIVE_FRONTEND_TYPE_DEFINITION_H
#define LLVMDERIVE_FRONTEND_TYPE_DEFINITION_H

#include "llvmderive/Frontend/SourceLocation.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace llvmderive {

enum class TypeShapeKind {
  TupleStruct,
  Struct,
  Enum,
  Union,
  UnitStruct,
};

/// Parsed member type spelling, e.g. `optional<i32>` or `Pair<string>`.
struct TypeExpr {
  std::string name;
  std::vector<TypeExpr> args;

  [[nodiscard]] bool isQualified() const;
  [[nodiscard]] std::string str() const;
};

struct RawAttribute {
  SourceLocation location;
  std::string name;
  std::optional<std::string> value;
};

struct FieldDecl {
  SourceLocation location;
  // Empty for unnamed (tuple) fields.
  std::string name;
  TypeExpr type;
  std::vector<RawAttribute> attributes;
};

struct VariantDecl {
  SourceLocation location;
  std::string name;
  std::optional<std::int64_t> discriminant;
  std::vector<RawAttribute> attributes;
};

struct TypeDefinition {
  SourceLocation location;
  std::string name;
  std::vector<std::string> generics;
  TypeShapeKind shape{TypeShapeKind::Struct};
  std::vector<FieldDecl> fields;
  std::vector<VariantDecl> variants;
  std::vector<RawAttribute> attributes;

  [[nodiscard]] bool isEnum() const { return shape == TypeShapeKind::Enum; }
  [[nodiscard]] bool isGeneric() const { return !generics.empty(); }
  [[nodiscard]] bool hasGenericParam(const std::string &param) const;
};

struct SchemaModule {
  std::string filePath;
  std::vector<std::string> namespaceComponents;
  std::vector<TypeDefinition> definitions;
};

[[nodiscard]] const char *shapeKindName(TypeShapeKind kind);

/// Discriminant of every variant in declaration order. Variants without an
/// explicit value take the previous value plus one, starting at zero.
[[nodiscard]] std::vector<std::int64_t>
effectiveDiscriminants(const TypeDefinition &def);

} // namespace llvmderive

#endif // LLVMDERIVE_FRONTEND_TYPE_DEFINITION_H
