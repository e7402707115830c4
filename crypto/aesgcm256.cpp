#include "crypto/aesgcm256.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <iterator>

namespace crypto
{

bool AES256GCM::chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce)
{
    return key.size() == key_sz && nonce.size() == nonce_sz;
}

AES256GCM::ctx_ptr AES256GCM::make_ctx()
{
    return ctx_ptr(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

std::optional<AES256GCM::ciphertext_t> AES256GCM::encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce))
    {
        return std::nullopt;
    }

    auto ctx = make_ctx();
    if (!ctx)
    {
        return std::nullopt;
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    ciphertext_t result;
    result.data.resize(plaintext.size());

    // Empty plaintext is legal for GCM; skip the update so data() may be null.
    len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), result.data.data(), std::addressof(len), plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), result.data.data() + len, std::addressof(final_len)) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(result.tag.size()), result.tag.data()) != 1)
    {
        return std::nullopt;
    }

    return result;
}

std::optional<AES256GCM::data_t> AES256GCM::decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    const ciphertext_t& ct,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce))
    {
        return std::nullopt;
    }

    auto ctx = make_ctx();
    if (!ctx)
    {
        return std::nullopt;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    data_t plaintext(ct.data.size());

    len = 0;
    if (!ct.data.empty() &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), std::addressof(len), ct.data.data(), static_cast<int>(ct.data.size())) != 1)
    {
        return std::nullopt;
    }

    tag_t tag = ct.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
    {
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, std::addressof(final_len)) != 1)
    {
        return std::nullopt;
    }

    return plaintext;
}

std::optional<AES256GCM::data_t> AES256GCM::seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad)
{
    nonce_t nonce{};
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1)
    {
        return std::nullopt;
    }

    auto ct = encrypt(key, nonce, plaintext, aad);
    if (!ct)
    {
        return std::nullopt;
    }

    data_t res;
    res.reserve(nonce.size() + ct->data.size() + ct->tag.size());
    auto ist = std::back_inserter(res);
    std::ranges::copy(nonce, ist);
    std::ranges::copy(ct->data, ist);
    std::ranges::copy(ct->tag, ist);
    return res;
}

std::optional<AES256GCM::data_t> AES256GCM::open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> aad)
{
    if (sealed.size() < nonce_sz + tag_sz)
    {
        return std::nullopt;
    }

    auto nonce_view = sealed.subspan(0, nonce_sz);
    auto data_view = sealed.subspan(nonce_sz, sealed.size() - nonce_sz - tag_sz);
    auto tag_view = sealed.subspan(sealed.size() - tag_sz);

    ciphertext_t ct{};
    ct.data.assign(data_view.begin(), data_view.end());
    std::ranges::copy(tag_view, ct.tag.begin());

    return decrypt(key, nonce_view, ct, aad);
}

} // namespace crypto
