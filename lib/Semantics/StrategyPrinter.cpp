#include "llvmderive/Semantics/StrategyPrinter.h"

#include <sstream>
#include <type_traits>

namespace llvmderive {

std::string printStrategy(const std::string &typeName,
                          const Strategy &strategy) {
  std::ostringstream out;
  out << strategyKindName(strategyKindOf(strategy)) << ' ' << typeName;
  std::visit(
      [&](const auto &node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, TransparentStrategy>) {
          out << '(' << node.inner.str() << ')';
        } else if constexpr (std::is_same_v<T, WeakEnumStrategy>) {
          out << " : " << integerReprName(node.representation).str() << " {";
          for (std::size_t i = 0; i < node.variants.size(); ++i) {
            out << (i > 0 ? ", " : " ") << node.variants[i].name << " = "
                << node.variants[i].discriminant;
          }
          out << " }";
        } else if constexpr (std::is_same_v<T, StrongEnumStrategy>) {
          out << " as \"" << node.typeName << "\" {";
          for (std::size_t i = 0; i < node.labels.size(); ++i) {
            out << (i > 0 ? ", " : " ") << node.labels[i].variant << " => \""
                << node.labels[i].label << '"';
          }
          out << " }";
        } else if constexpr (std::is_same_v<T, RecordStrategy>) {
          out << " as \"" << node.compositeTypeName << "\" {";
          for (std::size_t i = 0; i < node.fields.size(); ++i) {
            out << (i > 0 ? ", " : " ") << node.fields[i].name << ": "
                << node.fields[i].type.str();
          }
          out << " }";
        } else if constexpr (std::is_same_v<T, UnsupportedStrategy>) {
          out << ": " << node.reason;
        }
      },
      strategy);
  return out.str();
}

} // namespace llvmderive
