#include "packwerk/crypto.hpp"
#include "packwerk/error.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <sys/mman.h>
#include <unistd.h>

#include <cstring>

namespace packwerk {

static size_t page_size() {
  long ps = sysconf(_SC_PAGESIZE);
  return ps > 0 ? (size_t)ps : 4096u;
}
static size_t round_up(size_t n, size_t a) {
  return (n + a - 1) / a * a;
}

namespace {
struct CipherCtx {
  EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
  ~CipherCtx() { if (ctx) EVP_CIPHER_CTX_free(ctx); }
};
} // namespace

Key::Key() {
  alloc_len_ = round_up(KEY_LEN, page_size());
  void* p = mmap(nullptr, alloc_len_, PROT_READ | PROT_WRITE,
                 MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
  if (p == MAP_FAILED) {
    alloc_len_ = 0;
    throw Error(ErrorKind::Crypto, "cannot map key page");
  }
  // mlock может не пройти без CAP_IPC_LOCK / по RLIMIT_MEMLOCK, ключ всё равно рабочий
  (void)mlock(p, alloc_len_);
  key_ = static_cast<uint8_t*>(p);
  std::memset(key_, 0, alloc_len_);
}

Key::Key(const uint8_t* raw, size_t len) : Key() {
  if (len != KEY_LEN) {
    throw Error(ErrorKind::Crypto, "key must be 32 bytes, got " + std::to_string(len));
  }
  std::memcpy(key_, raw, KEY_LEN);
}

Key::~Key() {
  if (key_) {
    OPENSSL_cleanse(key_, KEY_LEN);
    munlock(key_, alloc_len_);
    munmap(key_, alloc_len_);
    key_ = nullptr;
  }
  alloc_len_ = 0;
}

std::shared_ptr<Key> Key::random() {
  std::shared_ptr<Key> k(new Key());
  if (1 != RAND_bytes(k->key_, (int)KEY_LEN)) {
    throw Error(ErrorKind::Crypto, "RAND_bytes failed for key");
  }
  return k;
}

std::shared_ptr<Key> Key::derive(const std::string& password, const Bytes& salt,
                                 uint32_t iterations) {
  if (iterations == 0) throw Error(ErrorKind::Crypto, "PBKDF2 iterations must be > 0");
  std::shared_ptr<Key> k(new Key());
  if (1 != PKCS5_PBKDF2_HMAC(password.data(), (int)password.size(),
                             salt.data(), (int)salt.size(),
                             (int)iterations, EVP_sha256(),
                             (int)KEY_LEN, k->key_)) {
    throw Error(ErrorKind::Crypto, "PBKDF2 key derivation failed");
  }
  return k;
}

Bytes random_bytes(size_t n) {
  Bytes out(n);
  if (n && 1 != RAND_bytes(out.data(), narrow<int>(n, "random length"))) {
    throw Error(ErrorKind::Crypto, "RAND_bytes failed");
  }
  return out;
}

Bytes Key::encrypt(const uint8_t* in, size_t len) const {
  const int in_len = narrow<int>(len, "plaintext length");

  Bytes out(NONCE_LEN + len + TAG_LEN);
  if (1 != RAND_bytes(out.data(), (int)NONCE_LEN)) {
    throw Error(ErrorKind::Crypto, "RAND_bytes failed for nonce");
  }

  CipherCtx c;
  if (!c.ctx) throw Error(ErrorKind::Crypto, "EVP_CIPHER_CTX_new failed");

  if (1 != EVP_EncryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      1 != EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, (int)NONCE_LEN, nullptr) ||
      1 != EVP_EncryptInit_ex(c.ctx, nullptr, nullptr, key_, out.data())) {
    throw Error(ErrorKind::Crypto, "encrypt init failed");
  }

  uint8_t* ct = out.data() + NONCE_LEN;
  int n = 0, total = 0;
  if (in_len > 0) {
    if (1 != EVP_EncryptUpdate(c.ctx, ct, &n, in, in_len)) {
      throw Error(ErrorKind::Crypto, "encrypt update failed");
    }
    total = n;
  }
  if (1 != EVP_EncryptFinal_ex(c.ctx, ct + total, &n)) {
    throw Error(ErrorKind::Crypto, "encrypt final failed");
  }
  total += n;
  if ((size_t)total != len) throw Error(ErrorKind::Crypto, "unexpected GCM output length");

  if (1 != EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, (int)TAG_LEN, ct + total)) {
    throw Error(ErrorKind::Crypto, "cannot read GCM tag");
  }
  return out;
}

Bytes Key::decrypt(const uint8_t* in, size_t len) const {
  if (len < OVERHEAD) {
    throw Error(ErrorKind::Crypto, "ciphertext shorter than nonce+tag (" + std::to_string(len) + " bytes)");
  }
  const size_t ct_len = len - OVERHEAD;
  const int ct_len_i = narrow<int>(ct_len, "ciphertext length");

  CipherCtx c;
  if (!c.ctx) throw Error(ErrorKind::Crypto, "EVP_CIPHER_CTX_new failed");

  if (1 != EVP_DecryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) ||
      1 != EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, (int)NONCE_LEN, nullptr) ||
      1 != EVP_DecryptInit_ex(c.ctx, nullptr, nullptr, key_, in)) {
    throw Error(ErrorKind::Crypto, "decrypt init failed");
  }

  Bytes out(ct_len + TAG_LEN);   // запас под final, ниже обрезаем
  int n = 0, total = 0;
  if (ct_len_i > 0) {
    if (1 != EVP_DecryptUpdate(c.ctx, out.data(), &n, in + NONCE_LEN, ct_len_i)) {
      throw Error(ErrorKind::Crypto, "decrypt update failed");
    }
    total = n;
  }

  uint8_t tag[TAG_LEN];
  std::memcpy(tag, in + NONCE_LEN + ct_len, TAG_LEN);
  if (1 != EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, (int)TAG_LEN, tag)) {
    throw Error(ErrorKind::Crypto, "cannot set GCM tag");
  }
  if (1 != EVP_DecryptFinal_ex(c.ctx, out.data() + total, &n)) {
    throw Error(ErrorKind::Crypto, "authentication failed (wrong key or corrupted data)");
  }
  total += n;
  out.resize((size_t)total);
  return out;
}

} // namespace packwerk
