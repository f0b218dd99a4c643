#include <mabi-pack/keystream.hxx>

namespace mabi_pack {

void Keystream::apply(char *first, char *last) noexcept {
  for (; first != last; ++first)
    *first = static_cast<char>(static_cast<unsigned char>(*first) ^
                               static_cast<unsigned char>(engine_()));
}

void Keystream::apply(const char *src, char *dest, std::size_t n) noexcept {
  for (std::size_t i = 0; i < n; ++i)
    dest[i] = static_cast<char>(static_cast<unsigned char>(src[i]) ^
                                static_cast<unsigned char>(engine_()));
}

} // namespace mabi_pack
