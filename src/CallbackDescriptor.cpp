#include <NGIN/FFI/CallbackDescriptor.hpp>

#include <cctype>
#include <utility>

namespace NGIN::FFI
{
  namespace
  {
    void AppendLower(std::string &out, const Type &t)
    {
      const auto name = t.ToString();
      out.reserve(out.size() + name.size());
      for (char c : name)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    // "a, b, c" with lower-cased names
    void AppendParameterNames(std::string &out, const ParameterList &params)
    {
      for (NGIN::UIntSize i = 0; i < params.Size(); ++i)
      {
        AppendLower(out, *params[i]);
        if (i + 1 < params.Size())
          out += ", ";
      }
    }
  } // namespace

  CallbackDescriptor::CallbackDescriptor(TypePtr returnType, ParameterList parameterTypes)
      : m_returnType(std::move(returnType)),
        m_parameterTypes(std::move(parameterTypes))
  {
    m_arity = m_parameterTypes.Size();
  }

  TypePtr CallbackDescriptor::GetParameterType(NGIN::UIntSize i) const
  {
    if (i >= m_parameterTypes.Size())
      return nullptr;
    return m_parameterTypes[i];
  }

  std::string CallbackDescriptor::Render() const
  {
    std::string out{"[ "};
    AppendParameterNames(out, m_parameterTypes);
    out += " ], ";
    AppendLower(out, *m_returnType);
    return out;
  }

  std::string CallbackDescriptor::Inspect() const
  {
    std::string out{"#<"};
    out += kKindName;
    out += ' ';
    out += Render();
    out += '>';
    return out;
  }

  std::string CallbackDescriptor::ToString() const
  {
    std::string out{"CallbackInfo[parameters=["};
    AppendParameterNames(out, m_parameterTypes);
    out += "] return=";
    AppendLower(out, *m_returnType);
    out += ']';
    return out;
  }

} // namespace NGIN::FFI
