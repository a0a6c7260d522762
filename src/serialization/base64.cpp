#include "stasis/serialization/base64.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

namespace stasis::serialization::base64 {

namespace {

bool in_alphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

int sextet(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    return c == '+' ? 62 : 63;
}

}  // namespace

std::string encode(const Value::Bytes& data) {
    if (data.empty()) {
        return {};
    }

    BIO* bio = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    if (BIO_write(bio, data.data(), static_cast<int>(data.size())) !=
            static_cast<int>(data.size()) ||
        BIO_flush(bio) != 1) {
        BIO_free_all(bio);
        throw SerializationException("base64 encoding failed");
    }

    BUF_MEM* buffer_ptr = nullptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);
    return result;
}

Value::Bytes decode(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw DecodeError("base64 length " + std::to_string(text.size()) +
                          " is not a multiple of 4");
    }

    std::size_t padding = 0;
    if (text[text.size() - 1] == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') ++padding;
    }

    for (std::size_t i = 0; i < text.size() - padding; ++i) {
        if (!in_alphabet(text[i])) {
            throw DecodeError("invalid base64 character at offset " +
                              std::to_string(i));
        }
    }

    // Bits dropped in front of the padding must be zero
    if (padding > 0) {
        const int unused_mask = padding == 2 ? 0x0f : 0x03;
        if ((sextet(text[text.size() - padding - 1]) & unused_mask) != 0) {
            throw DecodeError("non-zero bits before base64 padding");
        }
    }

    Value::Bytes result(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(
        result.data(), reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (written < 0) {
        throw DecodeError("malformed base64 payload");
    }

    // EVP_DecodeBlock counts the zero bytes behind the padding
    result.resize(static_cast<std::size_t>(written) - padding);
    return result;
}

}  // namespace stasis::serialization::base64
