#include "package/digest_deriver.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace fwbundle {

namespace {

constexpr size_t kRsaKeyBytes = 384;
constexpr int kRsaKeyBits = 3072;
constexpr std::uint8_t kCurveIdP192 = 1;
constexpr std::uint8_t kCurveIdP256 = 2;
// Refuse to slurp anything much larger than a PEM key.
constexpr size_t kMaxKeyFileBytes = 64 * 1024;

struct BioDeleter {
    void operator()(BIO* b) const { BIO_free(b); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); }
};
struct BnDeleter {
    void operator()(BIGNUM* b) const { BN_free(b); }
};
struct BnCtxDeleter {
    void operator()(BN_CTX* c) const { BN_CTX_free(c); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

// Holds raw key file bytes; wiped on destruction.
class SecretBuffer final {
public:
    SecretBuffer() = default;
    SecretBuffer(const SecretBuffer&) = delete;
    SecretBuffer& operator=(const SecretBuffer&) = delete;
    ~SecretBuffer() {
        if (!bytes_.empty()) OPENSSL_cleanse(bytes_.data(), bytes_.size());
    }

    std::vector<std::uint8_t>& bytes() { return bytes_; }
    const std::vector<std::uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<std::uint8_t> bytes_;
};

// Clears the thread's OpenSSL error queue on scope exit so nothing about a
// failed key parse lingers for later callers.
class ErrorQueueGuard final {
public:
    ErrorQueueGuard() = default;
    ErrorQueueGuard(const ErrorQueueGuard&) = delete;
    ErrorQueueGuard& operator=(const ErrorQueueGuard&) = delete;
    ~ErrorQueueGuard() { ERR_clear_error(); }
};

int NoPassphrase(char*, int, int, void*) { return 0; }

Result ReadKeyFile(const std::string& path, SecretBuffer& out) {
    Fd fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.Valid()) {
        return Result::Fail(ErrorKind::KeyMissing,
                            "signing key unreadable: " + path + " (" + std::strerror(errno) + ")");
    }

    struct stat st{};
    if (::fstat(fd.Get(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return Result::Fail(ErrorKind::KeyMissing, "signing key is not a regular file: " + path);
    }
    if (static_cast<size_t>(st.st_size) > kMaxKeyFileBytes) {
        return Result::Fail(ErrorKind::KeyUnsupported, "signing key file too large: " + path);
    }

    auto& buf = out.bytes();
    buf.resize(static_cast<size_t>(st.st_size));
    size_t off = 0;
    while (off < buf.size()) {
        const ssize_t n = ::read(fd.Get(), buf.data() + off, buf.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorKind::KeyMissing,
                                "signing key read failed: " + path + " (" + std::strerror(errno) + ")");
        }
        if (n == 0) break;
        off += static_cast<size_t>(n);
    }
    buf.resize(off);
    if (buf.empty()) {
        return Result::Fail(ErrorKind::KeyUnsupported, "signing key file is empty: " + path);
    }
    return Result::Ok();
}

// Private key first, then a bare public key.
PkeyPtr LoadPemKey(const SecretBuffer& pem) {
    const auto& b = pem.bytes();
    {
        BioPtr bio(BIO_new_mem_buf(b.data(), static_cast<int>(b.size())));
        if (!bio) return nullptr;
        PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, NoPassphrase, nullptr));
        if (key) return key;
    }
    ERR_clear_error();
    BioPtr bio(BIO_new_mem_buf(b.data(), static_cast<int>(b.size())));
    if (!bio) return nullptr;
    return PkeyPtr(PEM_read_bio_PUBKEY(bio.get(), nullptr, NoPassphrase, nullptr));
}

void AppendU32Le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
}

bool AppendBnLe(std::vector<std::uint8_t>& out, const BIGNUM* bn, size_t len) {
    const size_t pos = out.size();
    out.resize(pos + len);
    return BN_bn2lebinpad(bn, out.data() + pos, static_cast<int>(len)) == static_cast<int>(len);
}

// -n^-1 mod 2^32 for odd n0 (Newton iteration doubles correct bits each step).
std::uint32_t MontgomeryMPrime(std::uint32_t n0) {
    std::uint32_t inv = n0;
    for (int i = 0; i < 5; ++i) inv *= 2U - n0 * inv;
    return 0U - inv;
}

Result BuildRsaBlob(const EVP_PKEY* key, const std::string& path, std::vector<std::uint8_t>& blob) {
    if (EVP_PKEY_get_bits(key) != kRsaKeyBits) {
        return Result::Fail(ErrorKind::KeyUnsupported,
                            "RSA signing key must be 3072 bits (got " +
                                std::to_string(EVP_PKEY_get_bits(key)) + "): " + path);
    }

    BIGNUM* raw_n = nullptr;
    BIGNUM* raw_e = nullptr;
    if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_N, &raw_n) != 1 ||
        EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_RSA_E, &raw_e) != 1) {
        BN_free(raw_n);
        BN_free(raw_e);
        return Result::Fail(ErrorKind::KeyUnsupported, "cannot read RSA public numbers: " + path);
    }
    BnPtr n(raw_n);
    BnPtr e(raw_e);

    const BN_ULONG e_word = BN_get_word(e.get());
    if (e_word == static_cast<BN_ULONG>(-1) || e_word > 0xFFFFFFFFULL) {
        return Result::Fail(ErrorKind::KeyUnsupported, "RSA exponent does not fit 32 bits: " + path);
    }

    BnCtxPtr ctx(BN_CTX_new());
    BnPtr r(BN_new());
    BnPtr rinv(BN_new());
    if (!ctx || !r || !rinv) return Result::Fail(ErrorKind::Io, "BIGNUM allocation failed");

    // R^2 mod N with R = 2^3072
    if (BN_set_bit(r.get(), kRsaKeyBits * 2) != 1 ||
        BN_mod(rinv.get(), r.get(), n.get(), ctx.get()) != 1) {
        return Result::Fail(ErrorKind::KeyUnsupported, "RSA modulus arithmetic failed: " + path);
    }

    const BN_ULONG n0 = BN_mod_word(n.get(), 0x100000000ULL);
    if (n0 == static_cast<BN_ULONG>(-1) || (n0 & 1U) == 0) {
        return Result::Fail(ErrorKind::KeyUnsupported, "RSA modulus is not odd: " + path);
    }

    blob.clear();
    blob.reserve(kRsaKeyBytes * 2 + 8);
    if (!AppendBnLe(blob, n.get(), kRsaKeyBytes)) {
        return Result::Fail(ErrorKind::KeyUnsupported, "RSA modulus encoding failed: " + path);
    }
    AppendU32Le(blob, static_cast<std::uint32_t>(e_word));
    if (!AppendBnLe(blob, rinv.get(), kRsaKeyBytes)) {
        return Result::Fail(ErrorKind::KeyUnsupported, "RSA R^2 encoding failed: " + path);
    }
    AppendU32Le(blob, MontgomeryMPrime(static_cast<std::uint32_t>(n0)));
    return Result::Ok();
}

Result BuildEcdsaBlob(const EVP_PKEY* key,
                      const std::string& path,
                      std::vector<std::uint8_t>& blob,
                      SigningKeyType& type) {
    char group[64]{};
    size_t group_len = 0;
    if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME, group, sizeof(group), &group_len) != 1) {
        return Result::Fail(ErrorKind::KeyUnsupported, "cannot read ECDSA curve: " + path);
    }

    std::uint8_t curve_id = 0;
    size_t coord_len = 0;
    const int nid = OBJ_txt2nid(group);
    if (nid == NID_X9_62_prime256v1) {
        curve_id = kCurveIdP256;
        coord_len = 32;
        type = SigningKeyType::EcdsaP256;
    } else if (nid == NID_X9_62_prime192v1) {
        curve_id = kCurveIdP192;
        coord_len = 24;
        type = SigningKeyType::EcdsaP192;
    } else {
        return Result::Fail(ErrorKind::KeyUnsupported,
                            std::string("unsupported ECDSA curve '") + group + "': " + path);
    }

    BIGNUM* raw_x = nullptr;
    BIGNUM* raw_y = nullptr;
    if (EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_EC_PUB_X, &raw_x) != 1 ||
        EVP_PKEY_get_bn_param(key, OSSL_PKEY_PARAM_EC_PUB_Y, &raw_y) != 1) {
        BN_free(raw_x);
        BN_free(raw_y);
        return Result::Fail(ErrorKind::KeyUnsupported, "cannot read ECDSA public point: " + path);
    }
    BnPtr x(raw_x);
    BnPtr y(raw_y);

    blob.clear();
    blob.push_back(curve_id);
    if (!AppendBnLe(blob, x.get(), coord_len) || !AppendBnLe(blob, y.get(), coord_len)) {
        return Result::Fail(ErrorKind::KeyUnsupported, "ECDSA point encoding failed: " + path);
    }
    return Result::Ok();
}

} // namespace

const char* SigningKeyTypeName(SigningKeyType type) {
    switch (type) {
        case SigningKeyType::Rsa3072:   return "RSA-3072";
        case SigningKeyType::EcdsaP192: return "ECDSA-P192";
        case SigningKeyType::EcdsaP256: return "ECDSA-P256";
    }
    return "unknown";
}

Result DigestDeriver::Derive(const std::string& key_path, Sha256Digest& out, SigningKeyType* out_type) const {
    if (key_path.empty()) {
        return Result::Fail(ErrorKind::KeyMissing, "no signing key path given");
    }

    ErrorQueueGuard err_guard;
    PkeyPtr key;
    {
        SecretBuffer pem;
        auto rr = ReadKeyFile(key_path, pem);
        if (!rr.is_ok()) return rr;

        key = LoadPemKey(pem);
    }
    if (!key) {
        return Result::Fail(ErrorKind::KeyUnsupported, "not a recognised PEM signing key: " + key_path);
    }

    std::vector<std::uint8_t> blob;
    SigningKeyType type = SigningKeyType::Rsa3072;
    Result br = Result::Ok();
    switch (EVP_PKEY_get_base_id(key.get())) {
        case EVP_PKEY_RSA:
            br = BuildRsaBlob(key.get(), key_path, blob);
            break;
        case EVP_PKEY_EC:
            br = BuildEcdsaBlob(key.get(), key_path, blob, type);
            break;
        default:
            return Result::Fail(ErrorKind::KeyUnsupported,
                                "signing key must be RSA-3072 or ECDSA P-192/P-256: " + key_path);
    }
    if (!br.is_ok()) return br;

    Sha256Hasher hasher;
    hasher.Update(blob);
    if (!hasher.Final(out)) {
        return Result::Fail(ErrorKind::Io, "sha256 over public key blob failed");
    }

    if (out_type) *out_type = type;
    LogInfo("Secure Boot V2 public key digest (%s): %s",
            SigningKeyTypeName(type), HexEncode(out).c_str());
    return Result::Ok();
}

} // namespace fwbundle
