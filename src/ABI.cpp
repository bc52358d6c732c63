#include <NGIN/FFI/ABI.hpp>
#include <NGIN/FFI/CallbackDescriptor.hpp>

#include <cstring>

namespace NGIN::FFI
{
  namespace
  {
    constexpr std::uint64_t Align8(std::uint64_t x) { return (x + 7u) & ~std::uint64_t{7u}; }
  } // namespace

  NGINFFISignatureBlobV1 SignatureBlob::View() const noexcept
  {
    NGINFFISignatureBlobV1 out{};
    if (m_bytes.empty())
      return out;
    out.header = reinterpret_cast<const NGINFFISignatureV1 *>(m_bytes.data());
    out.blob = m_bytes.data();
    out.blobSize = static_cast<std::uint64_t>(m_bytes.size());
    return out;
  }

  SignatureBlob ExportSignatureV1(const CallbackDescriptor &descriptor)
  {
    const auto &params = descriptor.GetParameterTypes();
    const std::uint64_t arity = static_cast<std::uint64_t>(params.Size());

    NGINFFISignatureV1 hdr{};
    hdr.version = kSignatureABIVersion;
    hdr.flags = 0u;
    hdr.arity = static_cast<std::uint32_t>(arity);
    hdr.returnType = static_cast<std::uint8_t>(descriptor.GetReturnType()->GetNativeType());
    hdr.paramsOff = Align8(sizeof(NGINFFISignatureV1));
    hdr.totalSize = Align8(hdr.paramsOff + arity);

    // std::vector's allocator hands out storage aligned for the header.
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(hdr.totalSize), std::uint8_t{0});
    std::memcpy(bytes.data(), &hdr, sizeof(hdr));
    auto *codes = bytes.data() + hdr.paramsOff;
    for (NGIN::UIntSize i = 0; i < params.Size(); ++i)
      codes[i] = static_cast<std::uint8_t>(params[i]->GetNativeType());

    return SignatureBlob{std::move(bytes)};
  }

  std::expected<SignatureView, Error> ReadSignatureV1(const NGINFFISignatureBlobV1 &blob)
  {
    if (!blob.header || !blob.blob)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null signature"});
    const auto &h = *blob.header;
    if (h.version != kSignatureABIVersion)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "unsupported version"});

    // Section bounds: header first, then the code array, all inside the blob.
    const std::uint64_t end = h.paramsOff + h.arity;
    if (blob.blobSize < sizeof(NGINFFISignatureV1) || h.paramsOff < sizeof(NGINFFISignatureV1) ||
        end < h.paramsOff || end > blob.blobSize || h.totalSize > blob.blobSize)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "corrupt offsets"});

    const auto *base = static_cast<const std::uint8_t *>(blob.blob);
    SignatureView view{};
    const auto ret = NativeTypeFromCode(h.returnType);
    if (!ret)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown native type"});
    view.returnType = *ret;
    view.parameterCodes = std::span<const std::uint8_t>{base + h.paramsOff, static_cast<std::size_t>(h.arity)};
    for (auto code : view.parameterCodes)
    {
      if (!NativeTypeFromCode(code))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown native type"});
    }
    return view;
  }

} // namespace NGIN::FFI
