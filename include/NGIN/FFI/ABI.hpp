// ABI.hpp — Versioned C layout for handing a callback signature to a trampoline generator
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/FFI/Export.hpp>
#include <NGIN/FFI/NativeType.hpp>
#include <NGIN/FFI/Types.hpp>

#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

extern "C"
{

  //
  // Signature V1 blob format
  // - A header followed by `arity` one-byte NativeType codes.
  // - Offsets are measured from the blob base; no pointers are stored.
  // - Nested callbacks are encoded as POINTER, which is how they cross the boundary.
  //

  struct NGINFFISignatureV1
  {
    std::uint32_t version; // 1
    std::uint32_t flags;   // reserved
    std::uint32_t arity;
    std::uint8_t returnType; // NativeType code
    std::uint8_t pad[3]{0, 0, 0};
    std::uint64_t paramsOff; // start of the parameter code array
    std::uint64_t totalSize; // header + codes, 8-byte aligned
  };

  // A blob as seen by the consumer: header pointer plus base and size.
  struct NGINFFISignatureBlobV1
  {
    const NGINFFISignatureV1 *header; // points into blob memory
    const void *blob;
    std::uint64_t blobSize;
  };

} // extern "C"

namespace NGIN::FFI
{

  inline constexpr std::uint32_t kSignatureABIVersion = 1u;

  /** Owning storage for an exported signature. */
  class NGIN_FFI_API SignatureBlob
  {
  public:
    SignatureBlob() = default;
    explicit SignatureBlob(std::vector<std::uint8_t> bytes) : m_bytes(std::move(bytes)) {}

    [[nodiscard]] NGINFFISignatureBlobV1 View() const noexcept;
    [[nodiscard]] std::span<const std::uint8_t> Bytes() const noexcept { return m_bytes; }

  private:
    std::vector<std::uint8_t> m_bytes;
  };

  /** Decoded, bounds-checked view over a V1 blob. Valid while the blob lives. */
  struct SignatureView
  {
    NativeType returnType{NativeType::Void};
    std::span<const std::uint8_t> parameterCodes{};

    [[nodiscard]] NGIN::UIntSize Arity() const noexcept { return parameterCodes.size(); }
    [[nodiscard]] NativeType ParameterAt(NGIN::UIntSize i) const noexcept { return static_cast<NativeType>(parameterCodes[i]); }
  };

  [[nodiscard]] NGIN_FFI_API SignatureBlob ExportSignatureV1(const CallbackDescriptor &descriptor);

  // Rejects null input, foreign versions, sections outside the blob and unknown type codes.
  [[nodiscard]] NGIN_FFI_API std::expected<SignatureView, Error> ReadSignatureV1(const NGINFFISignatureBlobV1 &blob);

} // namespace NGIN::FFI
