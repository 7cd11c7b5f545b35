#pragma once
#include "syntax/Ast.hpp"
#include "llvm/ADT/StringRef.h"
#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>

namespace kwl {
namespace match {

// All matchers are null-safe: an absent node or a shape they do not
// recognise yields "no match".

// The literal behind `T{...}`, `&T{...}` or a parenthesised form.
const syntax::CompositeLit* compositeOf(const syntax::Expr* e);

// Last component of a literal's type: "Container" for corev1.Container,
// also for elided elements of a []corev1.Container literal.
llvm::StringRef typeNameOf(const syntax::Expr* e);

bool isShape(const syntax::Expr* e, llvm::StringRef typeName);

const syntax::KeyValueExpr* field(const syntax::CompositeLit* lit, llvm::StringRef name);
const syntax::Expr* fieldValue(const syntax::CompositeLit* lit, llvm::StringRef name);

const syntax::CompositeLit* nestedRecord(const syntax::Expr* e);
const syntax::CompositeLit* fieldRecord(const syntax::CompositeLit* lit, llvm::StringRef name);

// Follows nested record fields, eg. {"Spec", "Template", "Spec"}.
const syntax::CompositeLit* fieldPath(const syntax::CompositeLit* lit,
                                      std::initializer_list<llvm::StringRef> path);

// The ObjectMeta (or Metadata) record of a resource.
const syntax::CompositeLit* metadataOf(const syntax::CompositeLit* lit);

// Scalar extraction sees through one-argument helper or conversion calls,
// so ptr.To("x"), int32(3) and ptr(int32(3)) resolve like the bare literal.
std::optional<std::string> stringLiteral(const syntax::Expr* e);
std::optional<int64_t> intLiteral(const syntax::Expr* e);
std::optional<bool> boolLiteral(const syntax::Expr* e);
bool isTrue(const syntax::Expr* e);

// String-to-string pairs of a map literal. Non-literal maps (eg. a
// variable holding shared labels) are treated as empty.
std::map<std::string, std::string> mapLiteral(const syntax::Expr* e);

// Double-quoted form with Go-style escapes, for messages.
std::string quote(llvm::StringRef s);

} // namespace match
} // namespace kwl
