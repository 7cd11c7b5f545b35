#include "analyzers/Matchers.hpp"
#include "analyzers/Rules.hpp"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/FormatVariadic.h"
#include <algorithm>
#include <functional>
#include <map>
#include <optional>
#include <set>

using namespace kwl::syntax;

namespace kwl {
namespace rules {

void checkDuplicateNames(const SourceFile& file, IssueReporter& r) {
  struct First {
    std::string var;
    unsigned line;
  };
  std::map<std::pair<std::string, std::string>, First> seen;

  forEachTopLevelVar(file, [&](const DeclName& name, const Expr* value) {
    const CompositeLit* meta = match::metadataOf(match::compositeOf(value));
    if (!meta) return;
    std::optional<std::string> resName = match::stringLiteral(match::fieldValue(meta, "Name"));
    if (!resName || resName->empty()) return;
    std::optional<std::string> ns = match::stringLiteral(match::fieldValue(meta, "Namespace"));
    std::string namespaceName = ns && !ns->empty() ? *ns : "default";

    unsigned line = file.position(name.offset).line;
    auto inserted = seen.emplace(std::make_pair(namespaceName, *resName), First{name.name, line});
    if (inserted.second) return;
    const First& first = inserted.first->second;
    r.report(name.offset,
             llvm::formatv("Duplicate resource name {0} in namespace {1} (first declared as {2} "
                           "at line {3})",
                           match::quote(*resName), match::quote(namespaceName), first.var,
                           first.line)
                 .str());
  });
}

namespace {

// Reference graph between package-level variables of one file.
class DependencyGraph {
public:
  explicit DependencyGraph(const SourceFile& file) {
    forEachTopLevelVar(file, [&](const DeclName& name, const Expr* value) {
      if (index_.count(name.name)) return;
      index_[name.name] = (unsigned)nodes_.size();
      nodes_.push_back(Node{name.name, name.offset, value, {}});
    });
    for (Node& n : nodes_) collect(n.value, n);
  }

  // Depth-first search keeping the current path; a back edge to a node on
  // the path closes a cycle.
  template <typename Fn> void forEachCycle(Fn report) {
    std::vector<Color> color(nodes_.size(), Color::White);
    llvm::SmallVector<unsigned, 8> path;
    std::set<std::vector<unsigned>> reported;

    std::function<void(unsigned)> dfs = [&](unsigned u) {
      color[u] = Color::Gray;
      path.push_back(u);
      for (unsigned v : nodes_[u].edges) {
        if (color[v] == Color::Gray) {
          auto start = std::find(path.begin(), path.end(), v);
          std::vector<unsigned> cycle(start, path.end());
          std::vector<unsigned> key = cycle;
          std::sort(key.begin(), key.end());
          if (reported.insert(key).second) report(cycle);
        } else if (color[v] == Color::White) {
          dfs(v);
        }
      }
      path.pop_back();
      color[u] = Color::Black;
    };

    for (unsigned u = 0; u < nodes_.size(); ++u)
      if (color[u] == Color::White) dfs(u);
  }

  llvm::StringRef name(unsigned i) const { return nodes_[i].name; }
  unsigned offset(unsigned i) const { return nodes_[i].offset; }

private:
  enum class Color { White, Gray, Black };

  struct Node {
    std::string name;
    unsigned offset;
    const Expr* value;
    std::vector<unsigned> edges;
  };

  void addEdge(Node& from, llvm::StringRef to) {
    auto it = index_.find(to);
    if (it == index_.end()) return;
    if (std::find(from.edges.begin(), from.edges.end(), it->second) == from.edges.end())
      from.edges.push_back(it->second);
  }

  // Field keys, selected field names and type expressions never name a
  // variable.
  void collect(const Expr* e, Node& from) {
    if (!e) return;
    switch (e->kind()) {
    case Expr::Kind::Ident:
      addEdge(from, llvm::cast<Ident>(e)->name);
      return;
    case Expr::Kind::CompositeLit:
      for (const auto& el : llvm::cast<CompositeLit>(e)->elements) collect(el.get(), from);
      return;
    case Expr::Kind::KeyValue: {
      const auto* kv = llvm::cast<KeyValueExpr>(e);
      if (!llvm::isa<Ident>(kv->key.get())) collect(kv->key.get(), from);
      collect(kv->value.get(), from);
      return;
    }
    case Expr::Kind::Unary:
      collect(llvm::cast<UnaryExpr>(e)->operand.get(), from);
      return;
    case Expr::Kind::Binary:
      collect(llvm::cast<BinaryExpr>(e)->lhs.get(), from);
      collect(llvm::cast<BinaryExpr>(e)->rhs.get(), from);
      return;
    case Expr::Kind::Selector:
      collect(llvm::cast<SelectorExpr>(e)->base.get(), from);
      return;
    case Expr::Kind::Call: {
      const auto* call = llvm::cast<CallExpr>(e);
      collect(call->callee.get(), from);
      for (const auto& a : call->args) collect(a.get(), from);
      return;
    }
    case Expr::Kind::Index: {
      const auto* idx = llvm::cast<IndexExpr>(e);
      collect(idx->base.get(), from);
      for (const auto& i : idx->indices) collect(i.get(), from);
      return;
    }
    case Expr::Kind::Paren:
      collect(llvm::cast<ParenExpr>(e)->inner.get(), from);
      return;
    case Expr::Kind::BasicLit:
    case Expr::Kind::ArrayType:
    case Expr::Kind::MapType:
    case Expr::Kind::Opaque:
      return;
    }
  }

  std::vector<Node> nodes_;
  llvm::StringMap<unsigned> index_;
};

} // namespace

void checkCircularDependencies(const SourceFile& file, IssueReporter& r) {
  DependencyGraph graph(file);
  graph.forEachCycle([&](const std::vector<unsigned>& cycle) {
    std::string chain;
    for (unsigned n : cycle) chain += graph.name(n).str() + " -> ";
    chain += graph.name(cycle.front()).str();
    r.report(graph.offset(cycle.front()), "Circular dependency detected: " + chain);
  });
}

} // namespace rules
} // namespace kwl
