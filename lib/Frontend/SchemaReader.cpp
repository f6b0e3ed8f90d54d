//===----------------------------------------------------------------------===//
//
// Part of the llvm-derive project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements schema document loading on top of `llvm::json`.
///
/// The reader validates document structure only. Attribute names and values
/// are carried through untouched; their meaning is decided by the attribute
/// resolver once the shape of each type is known.
///
//===----------------------------------------------------------------------===//

#include "llvmderive/Frontend/SchemaReader.h"
#include "llvmderive/Frontend/TypeExprParser.h"
#include "llvmderive/Support/Diagnostics.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llvmderive
{
namespace
{

bool isIdentifier(llvm::StringRef text)
{
    if (text.empty())
    {
        return false;
    }
    if (!(std::isalpha(static_cast<unsigned char>(text.front())) || text.front() == '_'))
    {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

std::optional<TypeShapeKind> parseShapeKind(llvm::StringRef text)
{
    if (text == "tuple_struct")
    {
        return TypeShapeKind::TupleStruct;
    }
    if (text == "struct")
    {
        return TypeShapeKind::Struct;
    }
    if (text == "enum")
    {
        return TypeShapeKind::Enum;
    }
    if (text == "union")
    {
        return TypeShapeKind::Union;
    }
    if (text == "unit_struct")
    {
        return TypeShapeKind::UnitStruct;
    }
    return std::nullopt;
}

class SchemaReader final
{
public:
    SchemaReader(llvm::StringRef filePath, DiagnosticEngine& diagnostics)
        : diagnostics_(diagnostics)
    {
        module_.filePath = filePath.str();
    }

    llvm::Expected<SchemaModule> read(llvm::StringRef text)
    {
        const SourceLocation root{module_.filePath, ""};

        llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
        if (!parsed)
        {
            malformed(root, "invalid JSON: " + llvm::toString(parsed.takeError()));
            return failure();
        }

        const auto* document = parsed->getAsObject();
        if (!document)
        {
            malformed(root, "schema document must be a JSON object");
            return failure();
        }
        rejectUnknownKeys(*document, root, {"namespace", "types"});

        if (const auto* nsValue = document->get("namespace"))
        {
            readNamespace(*nsValue, root.child("namespace"));
        }

        const auto* typesValue = document->get("types");
        if (!typesValue)
        {
            malformed(root, "schema document requires a 'types' array");
            return failure();
        }
        const auto* types = typesValue->getAsArray();
        if (!types)
        {
            malformed(root.child("types"), "'types' must be an array");
            return failure();
        }

        for (std::size_t i = 0; i < types->size(); ++i)
        {
            if (auto def = readDefinition((*types)[i], root.child("types").child(i)))
            {
                module_.definitions.push_back(std::move(*def));
            }
        }

        if (diagnostics_.hasErrors())
        {
            return failure();
        }
        return std::move(module_);
    }

private:
    void malformed(const SourceLocation& location, std::string message)
    {
        diagnostics_.error(DiagnosticCode::MalformedSchema, location, std::move(message));
    }

    llvm::Error failure() const
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to read schema %s",
                                       module_.filePath.c_str());
    }

    void rejectUnknownKeys(const llvm::json::Object&           object,
                           const SourceLocation&               location,
                           std::initializer_list<const char*> allowed)
    {
        std::vector<std::string> unknown;
        for (const auto& entry : object)
        {
            const llvm::StringRef key = entry.first;
            const bool known = std::any_of(allowed.begin(), allowed.end(), [&](const char* const candidate) {
                return key == candidate;
            });
            if (!known)
            {
                unknown.push_back(key.str());
            }
        }
        // json::Object iteration order is unspecified.
        std::sort(unknown.begin(), unknown.end());
        for (const auto& key : unknown)
        {
            malformed(location.child(key), "unknown key '" + key + "'");
        }
    }

    std::optional<std::string> readIdentifier(const llvm::json::Object& object,
                                              llvm::StringRef           key,
                                              const SourceLocation&     location,
                                              llvm::StringRef           what)
    {
        const auto* value = object.get(key);
        if (!value)
        {
            malformed(location, what.str() + " requires '" + key.str() + "'");
            return std::nullopt;
        }
        const auto text = value->getAsString();
        if (!text)
        {
            malformed(location.child(key.str()), "'" + key.str() + "' must be a string");
            return std::nullopt;
        }
        if (!isIdentifier(*text))
        {
            malformed(location.child(key.str()), "'" + text->str() + "' is not a valid identifier");
            return std::nullopt;
        }
        return text->str();
    }

    void readNamespace(const llvm::json::Value& value, const SourceLocation& location)
    {
        const auto text = value.getAsString();
        if (!text)
        {
            malformed(location, "'namespace' must be a dotted string");
            return;
        }
        llvm::SmallVector<llvm::StringRef, 4> parts;
        text->split(parts, '.');
        for (const llvm::StringRef part : parts)
        {
            if (!isIdentifier(part))
            {
                malformed(location, "namespace component '" + part.str() + "' is not a valid identifier");
                return;
            }
            module_.namespaceComponents.push_back(part.str());
        }
    }

    std::vector<RawAttribute> readAttributes(const llvm::json::Object& owner, const SourceLocation& ownerLocation)
    {
        std::vector<RawAttribute> out;
        const auto*               value = owner.get("attributes");
        if (!value)
        {
            return out;
        }
        const SourceLocation location = ownerLocation.child("attributes");
        const auto*          array    = value->getAsArray();
        if (!array)
        {
            malformed(location, "'attributes' must be an array");
            return out;
        }

        for (std::size_t i = 0; i < array->size(); ++i)
        {
            const SourceLocation itemLocation = location.child(i);
            const auto*          item         = (*array)[i].getAsObject();
            if (!item)
            {
                malformed(itemLocation, "attribute must be an object");
                continue;
            }
            rejectUnknownKeys(*item, itemLocation, {"name", "value"});

            RawAttribute attribute;
            attribute.location = itemLocation;
            const auto name    = item->getString("name");
            if (!name || name->empty())
            {
                malformed(itemLocation, "attribute requires a non-empty string 'name'");
                continue;
            }
            attribute.name = name->str();
            if (const auto* rawValue = item->get("value"))
            {
                const auto text = rawValue->getAsString();
                if (!text)
                {
                    malformed(itemLocation.child("value"), "attribute value must be a string");
                    continue;
                }
                attribute.value = text->str();
            }
            out.push_back(std::move(attribute));
        }
        return out;
    }

    void readGenerics(const llvm::json::Object& object, const SourceLocation& location, TypeDefinition& def)
    {
        const auto* value = object.get("generics");
        if (!value)
        {
            return;
        }
        const auto* array = value->getAsArray();
        if (!array)
        {
            malformed(location.child("generics"), "'generics' must be an array of identifiers");
            return;
        }
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            const auto text = (*array)[i].getAsString();
            if (!text || !isIdentifier(*text))
            {
                malformed(location.child("generics").child(i), "generic parameter must be an identifier");
                continue;
            }
            if (def.hasGenericParam(text->str()))
            {
                malformed(location.child("generics").child(i),
                          "generic parameter '" + text->str() + "' declared twice");
                continue;
            }
            def.generics.push_back(text->str());
        }
    }

    void readFields(const llvm::json::Object& object, const SourceLocation& location, TypeDefinition& def)
    {
        const auto* value = object.get("fields");
        if (!value)
        {
            return;
        }
        const SourceLocation fieldsLocation = location.child("fields");
        const auto*          array          = value->getAsArray();
        if (!array)
        {
            malformed(fieldsLocation, "'fields' must be an array");
            return;
        }

        const bool unnamed = def.shape == TypeShapeKind::TupleStruct;
        for (std::size_t i = 0; i < array->size(); ++i)
        {
            const SourceLocation itemLocation = fieldsLocation.child(i);
            const auto*          item         = (*array)[i].getAsObject();
            if (!item)
            {
                malformed(itemLocation, "field must be an object");
                continue;
            }
            rejectUnknownKeys(*item, itemLocation, {"name", "type", "attributes"});

            FieldDecl field;
            field.location = itemLocation;
            if (unnamed)
            {
                if (item->get("name") != nullptr)
                {
                    malformed(itemLocation.child("name"), "fields of a tuple_struct are unnamed");
                    continue;
                }
            }
            else
            {
                auto name = readIdentifier(*item, "name", itemLocation, "field");
                if (!name)
                {
                    continue;
                }
                const bool duplicate = std::any_of(def.fields.begin(), def.fields.end(), [&](const FieldDecl& f) {
                    return f.name == *name;
                });
                if (duplicate)
                {
                    malformed(itemLocation.child("name"), "field '" + *name + "' declared twice");
                    continue;
                }
                field.name = std::move(*name);
            }

            const auto typeText = item->getString("type");
            if (!typeText)
            {
                malformed(itemLocation, "field requires a string 'type'");
                continue;
            }
            auto type = parseTypeExpr(*typeText);
            if (!type)
            {
                malformed(itemLocation.child("type"), llvm::toString(type.takeError()));
                continue;
            }
            field.type       = std::move(*type);
            field.attributes = readAttributes(*item, itemLocation);
            def.fields.push_back(std::move(field));
        }
    }

    void readVariants(const llvm::json::Object& object, const SourceLocation& location, TypeDefinition& def)
    {
        const auto* value = object.get("variants");
        if (!value)
        {
            return;
        }
        const SourceLocation variantsLocation = location.child("variants");
        const auto*          array            = value->getAsArray();
        if (!array)
        {
            malformed(variantsLocation, "'variants' must be an array");
            return;
        }

        for (std::size_t i = 0; i < array->size(); ++i)
        {
            const SourceLocation itemLocation = variantsLocation.child(i);
            const auto*          item         = (*array)[i].getAsObject();
            if (!item)
            {
                malformed(itemLocation, "variant must be an object");
                continue;
            }
            rejectUnknownKeys(*item, itemLocation, {"name", "discriminant", "attributes"});

            VariantDecl variant;
            variant.location = itemLocation;
            auto name        = readIdentifier(*item, "name", itemLocation, "variant");
            if (!name)
            {
                continue;
            }
            const bool duplicate = std::any_of(def.variants.begin(), def.variants.end(), [&](const VariantDecl& v) {
                return v.name == *name;
            });
            if (duplicate)
            {
                malformed(itemLocation.child("name"), "variant '" + *name + "' declared twice");
                continue;
            }
            variant.name = std::move(*name);

            if (const auto* rawDiscriminant = item->get("discriminant"))
            {
                const auto discriminant = rawDiscriminant->getAsInteger();
                if (!discriminant)
                {
                    malformed(itemLocation.child("discriminant"), "discriminant must be a 64-bit signed integer");
                    continue;
                }
                variant.discriminant = *discriminant;
            }
            variant.attributes = readAttributes(*item, itemLocation);
            def.variants.push_back(std::move(variant));
        }
    }

    std::optional<TypeDefinition> readDefinition(const llvm::json::Value& value, const SourceLocation& location)
    {
        const auto* object = value.getAsObject();
        if (!object)
        {
            malformed(location, "type definition must be an object");
            return std::nullopt;
        }
        rejectUnknownKeys(*object, location, {"name", "kind", "generics", "attributes", "fields", "variants"});

        TypeDefinition def;
        def.location = location;
        auto name    = readIdentifier(*object, "name", location, "type definition");
        if (!name)
        {
            return std::nullopt;
        }
        def.name = std::move(*name);

        const auto kindText = object->getString("kind");
        if (!kindText)
        {
            malformed(location, "type definition '" + def.name + "' requires a string 'kind'");
            return std::nullopt;
        }
        const auto kind = parseShapeKind(*kindText);
        if (!kind)
        {
            malformed(location.child("kind"),
                      "unknown kind '" + kindText->str() +
                          "' (expected tuple_struct, struct, enum, union, or unit_struct)");
            return std::nullopt;
        }
        def.shape = *kind;

        const bool takesFields = def.shape == TypeShapeKind::TupleStruct || def.shape == TypeShapeKind::Struct ||
                                 def.shape == TypeShapeKind::Union;
        if (!takesFields && object->get("fields") != nullptr)
        {
            malformed(location.child("fields"), std::string("a ") + shapeKindName(def.shape) + " has no fields");
        }
        if (def.shape != TypeShapeKind::Enum && object->get("variants") != nullptr)
        {
            malformed(location.child("variants"), std::string("a ") + shapeKindName(def.shape) + " has no variants");
        }

        readGenerics(*object, location, def);
        def.attributes = readAttributes(*object, location);
        if (takesFields)
        {
            readFields(*object, location, def);
        }
        if (def.shape == TypeShapeKind::Enum)
        {
            readVariants(*object, location, def);
        }
        return def;
    }

    DiagnosticEngine& diagnostics_;
    SchemaModule      module_;
};

}  // namespace

llvm::Expected<SchemaModule> readSchemaText(llvm::StringRef filePath, llvm::StringRef text, DiagnosticEngine& diagnostics)
{
    return SchemaReader(filePath, diagnostics).read(text);
}

llvm::Expected<SchemaModule> readSchemaFile(llvm::StringRef filePath, DiagnosticEngine& diagnostics)
{
    auto buffer = llvm::MemoryBuffer::getFile(filePath);
    if (!buffer)
    {
        diagnostics.error(DiagnosticCode::MalformedSchema,
                          SourceLocation{filePath.str(), ""},
                          "cannot read schema: " + buffer.getError().message());
        return llvm::createStringError(buffer.getError(), "failed to open %s", filePath.str().c_str());
    }
    return readSchemaText(filePath, (*buffer)->getBuffer(), diagnostics);
}

}  // namespace llvmderive
