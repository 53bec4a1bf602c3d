#include <NGIN/Hierarchy/ClassInfo.hpp>

#include <string>

namespace NGIN::Hierarchy
{

  std::string DescribeChain(const ClassInfo &info)
  {
    std::string out{info.name};
    for (const auto *p = info.parent; p != nullptr; p = p->parent)
    {
      out += " : ";
      out += p->name;
    }
    return out;
  }

  const ClassInfo *AncestorAt(const ClassInfo &info, Depth depth) noexcept
  {
    if (depth > info.depth)
      return nullptr;
    const auto *p = &info;
    while (p->depth != depth)
      p = p->parent;
    return p;
  }

  bool IsSameOrAncestor(const ClassInfo &cls, const ClassInfo &ancestor) noexcept
  {
    const auto *p = AncestorAt(cls, ancestor.depth);
    return p != nullptr && p->key == ancestor.key;
  }

} // namespace NGIN::Hierarchy
