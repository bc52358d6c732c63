#include <NGIN/FFI/Registry.hpp>

#include <utility>

namespace NGIN::FFI::detail
{
  namespace
  {
    void AddKind(Registry &reg, std::string_view name, KindId parentId)
    {
      const auto id = KindIdOf(name);
      const auto idx = static_cast<NGIN::UInt32>(reg.kinds.Size());
      reg.kinds.PushBack(KindDesc{std::string{name}, id, parentId});
      reg.byId.Insert(id, idx);
    }

    Registry MakeRegistry()
    {
      Registry reg{};
      AddKind(reg, kTypeKind, 0);
      AddKind(reg, kBuiltinKind, KindIdOf(kTypeKind));
      AddKind(reg, kCallbackKind, KindIdOf(kTypeKind));
      AddKind(reg, kArrayKind, 0);
      return reg;
    }
  } // namespace

  Registry &GetRegistry() noexcept
  {
    static Registry g_registry = MakeRegistry();
    return g_registry;
  }

} // namespace NGIN::FFI::detail

namespace NGIN::FFI
{

  using detail::GetRegistry;

  std::expected<KindId, Error> RegisterKind(std::string_view name, std::string_view parent)
  {
    if (name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "empty kind name"});

    auto &reg = GetRegistry();
    KindId parentId = 0;
    if (!parent.empty())
    {
      parentId = KindIdOf(parent);
      if (!reg.byId.GetPtr(parentId))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown parent kind " + std::string{parent}});
    }

    const auto id = KindIdOf(name);
    if (auto *p = reg.byId.GetPtr(id))
    {
      const auto &existing = reg.kinds[*p];
      if (existing.parentId != parentId)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "kind " + std::string{name} + " already registered with another parent"});
      return id;
    }

    const auto idx = static_cast<NGIN::UInt32>(reg.kinds.Size());
    reg.kinds.PushBack(KindDesc{std::string{name}, id, parentId});
    reg.byId.Insert(id, idx);
    return id;
  }

  std::optional<KindDesc> FindKind(std::string_view name)
  {
    const auto &reg = GetRegistry();
    if (auto *p = reg.byId.GetPtr(KindIdOf(name)))
      return reg.kinds[*p];
    return std::nullopt;
  }

  std::expected<KindDesc, Error> GetKind(std::string_view name)
  {
    if (auto k = FindKind(name))
      return std::move(*k);
    return std::unexpected(Error{ErrorCode::NotFound, "kind not found"});
  }

  bool IsKindOf(std::string_view name, std::string_view ancestor) noexcept
  {
    const auto &reg = GetRegistry();
    const auto target = KindIdOf(ancestor);
    auto id = KindIdOf(name);
    // Parent chains are short and acyclic: a parent must exist before its child.
    while (id != 0)
    {
      if (id == target)
        return true;
      auto *p = reg.byId.GetPtr(id);
      if (!p)
        return false;
      id = reg.kinds[*p].parentId;
    }
    return false;
  }

  NGIN::UIntSize KindCount() noexcept
  {
    return GetRegistry().kinds.Size();
  }

} // namespace NGIN::FFI
