#include <gtest/gtest.h>

#include "package/digest_deriver.hpp"

#include "testing.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <algorithm>
#include <filesystem>
#include <vector>

namespace fwbundle {

namespace {

// Secure Boot V2 ECDSA blob rebuilt from the encoded public point:
// curve id, then X and Y little-endian.
Sha256Digest ExpectedEcdsaDigest(const std::string& pem_path, std::uint8_t curve_id, size_t coord_len) {
    FILE* f = std::fopen(pem_path.c_str(), "r");
    if (!f) throw std::runtime_error("cannot open " + pem_path);
    EVP_PKEY* key = PEM_read_PrivateKey(f, nullptr, nullptr, nullptr);
    std::fclose(f);
    if (!key) throw std::runtime_error("cannot parse " + pem_path);

    std::vector<std::uint8_t> point(1 + 2 * coord_len);
    size_t len = 0;
    const int ok = EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY,
                                                   point.data(), point.size(), &len);
    EVP_PKEY_free(key);
    if (ok != 1 || len != point.size() || point[0] != 0x04) throw std::runtime_error("unexpected point");

    std::vector<std::uint8_t> blob{curve_id};
    blob.insert(blob.end(), point.rbegin() + static_cast<std::ptrdiff_t>(coord_len), point.rend() - 1);
    blob.insert(blob.end(), point.rbegin(), point.rbegin() + static_cast<std::ptrdiff_t>(coord_len));

    Sha256Digest out{};
    unsigned int out_len = 0;
    EVP_Digest(blob.data(), blob.size(), out.data(), &out_len, EVP_sha256(), nullptr);
    return out;
}

void AppendLe(std::vector<std::uint8_t>& blob, const BIGNUM* bn, int len) {
    std::vector<std::uint8_t> le(static_cast<size_t>(len));
    if (BN_bn2lebinpad(bn, le.data(), len) != len) throw std::runtime_error("BN_bn2lebinpad failed");
    blob.insert(blob.end(), le.begin(), le.end());
}

// Secure Boot V2 RSA-3072 blob rebuilt with plain BIGNUM arithmetic:
// N, e (u32), R^2 mod N with R = 2^3072, then m' = -N^-1 mod 2^32 (u32).
Sha256Digest ExpectedRsaDigest(const std::string& pem_path) {
    FILE* f = std::fopen(pem_path.c_str(), "r");
    if (!f) throw std::runtime_error("cannot open " + pem_path);
    EVP_PKEY* key = PEM_read_PrivateKey(f, nullptr, nullptr, nullptr);
    std::fclose(f);
    if (!key) throw std::runtime_error("cannot parse " + pem_path);

    BIGNUM* n = nullptr;
    BIGNUM* e = nullptr;
    EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &n);
    EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_E, &e);
    EVP_PKEY_free(key);
    if (!n || !e) throw std::runtime_error("missing RSA numbers");

    BN_CTX* ctx = BN_CTX_new();
    BIGNUM* r2 = BN_new();
    BIGNUM* two32 = BN_new();
    BIGNUM* inv = BN_new();
    BN_set_bit(r2, 6144);
    BN_mod(r2, r2, n, ctx);
    BN_set_bit(two32, 32);
    BN_mod_inverse(inv, n, two32, ctx);
    BN_sub(inv, two32, inv);

    std::vector<std::uint8_t> blob;
    AppendLe(blob, n, 384);
    AppendLe(blob, e, 4);
    AppendLe(blob, r2, 384);
    AppendLe(blob, inv, 4);

    BN_free(n);
    BN_free(e);
    BN_free(r2);
    BN_free(two32);
    BN_free(inv);
    BN_CTX_free(ctx);

    Sha256Digest out{};
    unsigned int out_len = 0;
    EVP_Digest(blob.data(), blob.size(), out.data(), &out_len, EVP_sha256(), nullptr);
    return out;
}

void WriteRsaKeyWithExponent(const std::string& path, unsigned long exponent) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
    BIGNUM* e = BN_new();
    BN_set_word(e, exponent);
    EVP_PKEY* pkey = nullptr;
    const bool ok = ctx && EVP_PKEY_keygen_init(ctx) == 1 &&
                    EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, 3072) == 1 &&
                    EVP_PKEY_CTX_set1_rsa_keygen_pubexp(ctx, e) == 1 &&
                    EVP_PKEY_generate(ctx, &pkey) == 1;
    BN_free(e);
    EVP_PKEY_CTX_free(ctx);
    if (!ok) throw std::runtime_error("RSA key generation failed");
    testutil::WriteKey(pkey, path);
}

void WritePublicKeyOnly(const std::string& private_pem, const std::string& public_pem) {
    FILE* in = std::fopen(private_pem.c_str(), "r");
    if (!in) throw std::runtime_error("cannot open " + private_pem);
    EVP_PKEY* key = PEM_read_PrivateKey(in, nullptr, nullptr, nullptr);
    std::fclose(in);
    FILE* out = std::fopen(public_pem.c_str(), "w");
    if (!key || !out) throw std::runtime_error("cannot convert key");
    PEM_write_PUBKEY(out, key);
    std::fclose(out);
    EVP_PKEY_free(key);
}

} // namespace

TEST(DigestDeriverTest, EcdsaP256MatchesPublicPoint) {
    testutil::TemporaryDirectory tmp;
    const std::string key = tmp.Sub("keys/p256.pem");
    testutil::WriteEcKey(key, "P-256");

    DigestDeriver deriver;
    Sha256Digest digest{};
    SigningKeyType type = SigningKeyType::Rsa3072;
    auto r = deriver.Derive(key, digest, &type);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(type, SigningKeyType::EcdsaP256);
    EXPECT_EQ(digest, ExpectedEcdsaDigest(key, 2, 32));
}

TEST(DigestDeriverTest, EcdsaP192IsSupported) {
    testutil::TemporaryDirectory tmp;
    const std::string key = tmp.Sub("keys/p192.pem");
    testutil::WriteEcKey(key, "P-192");

    DigestDeriver deriver;
    Sha256Digest digest{};
    SigningKeyType type = SigningKeyType::Rsa3072;
    auto r = deriver.Derive(key, digest, &type);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(type, SigningKeyType::EcdsaP192);
    EXPECT_EQ(digest, ExpectedEcdsaDigest(key, 1, 24));
}

TEST(DigestDeriverTest, Rsa3072IsDeterministic) {
    testutil::TemporaryDirectory tmp;
    const std::string key = tmp.Sub("keys/rsa.pem");
    testutil::WriteRsaKey(key, 3072);

    DigestDeriver deriver;
    Sha256Digest first{};
    Sha256Digest second{};
    SigningKeyType type = SigningKeyType::EcdsaP256;
    ASSERT_TRUE(deriver.Derive(key, first, &type).is_ok());
    ASSERT_TRUE(deriver.Derive(key, second).is_ok());
    EXPECT_EQ(type, SigningKeyType::Rsa3072);
    EXPECT_EQ(first, second);
    EXPECT_NE(first, Sha256Digest{});
}

TEST(DigestDeriverTest, Rsa3072MatchesMontgomeryBlob) {
    testutil::TemporaryDirectory tmp;
    const std::string key = tmp.Sub("keys/rsa.pem");
    testutil::WriteRsaKey(key, 3072);

    Sha256Digest digest{};
    auto r = DigestDeriver().Derive(key, digest);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(digest, ExpectedRsaDigest(key));
}

TEST(DigestDeriverTest, Rsa3072SmallExponentMatchesMontgomeryBlob) {
    testutil::TemporaryDirectory tmp;
    const std::string key = tmp.Sub("keys/rsa_e3.pem");
    WriteRsaKeyWithExponent(key, 3);

    Sha256Digest digest{};
    auto r = DigestDeriver().Derive(key, digest);
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(digest, ExpectedRsaDigest(key));
}

TEST(DigestDeriverTest, PublicKeyGivesSameDigestAsPrivateKey) {
    testutil::TemporaryDirectory tmp;
    const std::string key = tmp.Sub("keys/p256.pem");
    const std::string pub = tmp.Sub("keys/p256.pub.pem");
    testutil::WriteEcKey(key, "P-256");
    WritePublicKeyOnly(key, pub);

    DigestDeriver deriver;
    Sha256Digest from_private{};
    Sha256Digest from_public{};
    ASSERT_TRUE(deriver.Derive(key, from_private).is_ok());
    ASSERT_TRUE(deriver.Derive(pub, from_public).is_ok());
    EXPECT_EQ(from_private, from_public);
}

TEST(DigestDeriverTest, DifferentKeysGiveDifferentDigests) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteEcKey(tmp.Sub("keys/a.pem"));
    testutil::WriteEcKey(tmp.Sub("keys/b.pem"));

    DigestDeriver deriver;
    Sha256Digest a{};
    Sha256Digest b{};
    ASSERT_TRUE(deriver.Derive(tmp.Sub("keys/a.pem"), a).is_ok());
    ASSERT_TRUE(deriver.Derive(tmp.Sub("keys/b.pem"), b).is_ok());
    EXPECT_NE(a, b);
}

TEST(DigestDeriverTest, MissingKeyIsKeyMissing) {
    testutil::TemporaryDirectory tmp;
    DigestDeriver deriver;
    Sha256Digest digest{};

    auto r = deriver.Derive(tmp.Sub("keys/absent.pem"), digest);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ErrorKind::KeyMissing);
    EXPECT_TRUE(r.is_key_error());
    EXPECT_NE(r.msg.find("absent.pem"), std::string::npos);

    r = deriver.Derive("", digest);
    EXPECT_EQ(r.err, ErrorKind::KeyMissing);

    r = deriver.Derive(tmp.Path(), digest);
    EXPECT_EQ(r.err, ErrorKind::KeyMissing);
}

TEST(DigestDeriverTest, UnsupportedKeysAreKeyUnsupported) {
    testutil::TemporaryDirectory tmp;
    testutil::WriteFile(tmp.Sub("empty.pem"), "");
    testutil::WriteFile(tmp.Sub("garbage.pem"), "-----BEGIN NONSENSE-----\nAAAA\n-----END NONSENSE-----\n");
    testutil::WriteRsaKey(tmp.Sub("rsa2048.pem"), 2048);
    testutil::WriteEcKey(tmp.Sub("p384.pem"), "P-384");
    testutil::WriteEd25519Key(tmp.Sub("ed25519.pem"));

    DigestDeriver deriver;
    for (const char* name : {"empty.pem", "garbage.pem", "rsa2048.pem", "p384.pem", "ed25519.pem"}) {
        Sha256Digest digest{};
        auto r = deriver.Derive(tmp.Sub(name), digest);
        ASSERT_FALSE(r.is_ok()) << name;
        EXPECT_EQ(r.err, ErrorKind::KeyUnsupported) << name;
        EXPECT_TRUE(r.is_key_error()) << name;
        EXPECT_NE(r.msg.find(name), std::string::npos) << r.msg;
    }
}

TEST(DigestDeriverTest, KeyTypeNames) {
    EXPECT_STREQ(SigningKeyTypeName(SigningKeyType::Rsa3072), "RSA-3072");
    EXPECT_STREQ(SigningKeyTypeName(SigningKeyType::EcdsaP256), "ECDSA-P256");
}

} // namespace fwbundle
