#include <bastion/blake3/hash.hpp>
#include <bastion/crypto/secp256k1.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>

namespace bastion::crypto {

namespace {

using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_key_ptr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

struct curve final {
  ec_group_ptr group{nullptr, EC_GROUP_free};
  bignum_ptr order{nullptr, BN_free};
  bn_ctx_ptr ctx{nullptr, BN_CTX_free};
};

std::optional<curve> make_curve() {
  auto out = curve{};
  out.group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
  out.order.reset(BN_new());
  out.ctx.reset(BN_CTX_new());
  if (!out.group || !out.order || !out.ctx) {
    return std::nullopt;
  }
  if (EC_GROUP_get_order(out.group.get(), out.order.get(), out.ctx.get()) !=
      1) {
    return std::nullopt;
  }
  return out;
}

bignum_ptr make_bignum(const uint8_t* data, const size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr), BN_free};
}

bool write_fixed(const BIGNUM* value, uint8_t* out) {
  return BN_bn2binpad(value, out, 32) == 32;
}

std::optional<bastion::schema::public_key_t> compress(const curve& c,
                                                      const EC_POINT* point) {
  auto out = bastion::schema::public_key_t{};
  auto written = EC_POINT_point2oct(c.group.get(), point,
                                    POINT_CONVERSION_COMPRESSED, out.data(),
                                    out.size(), c.ctx.get());
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

// Scalar in [1, n) or nothing.
bool in_scalar_range(const curve& c, const BIGNUM* value) {
  return !BN_is_zero(value) && BN_cmp(value, c.order.get()) < 0;
}

}  // namespace

bool available() {
  static const auto available_now = make_curve().has_value();
  return available_now;
}

std::optional<private_key_t> generate_private_key() {
  auto c = make_curve();
  if (!c) {
    return std::nullopt;
  }
  auto d = bignum_ptr{BN_new(), BN_free};
  if (!d) {
    return std::nullopt;
  }
  do {
    if (BN_rand_range(d.get(), c->order.get()) != 1) {
      return std::nullopt;
    }
  } while (BN_is_zero(d.get()));
  auto out = private_key_t{};
  if (!write_fixed(d.get(), out.data())) {
    return std::nullopt;
  }
  return out;
}

std::optional<bastion::schema::public_key_t> derive_public_key(
    const private_key_t& key) {
  auto c = make_curve();
  if (!c) {
    return std::nullopt;
  }
  auto d = make_bignum(key.data(), key.size());
  if (!d || !in_scalar_range(*c, d.get())) {
    return std::nullopt;
  }
  auto q = ec_point_ptr{EC_POINT_new(c->group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(c->group.get(), q.get(), d.get(), nullptr, nullptr,
                         c->ctx.get()) != 1) {
    return std::nullopt;
  }
  return compress(*c, q.get());
}

std::optional<bastion::schema::recoverable_signature_t> sign_recoverable(
    const bastion::schema::hash32_t& digest,
    const private_key_t& key) {
  auto c = make_curve();
  if (!c) {
    return std::nullopt;
  }
  auto* group = c->group.get();
  const auto* n = c->order.get();

  auto d = make_bignum(key.data(), key.size());
  if (!d || !in_scalar_range(*c, d.get())) {
    return std::nullopt;
  }
  BN_set_flags(d.get(), BN_FLG_CONSTTIME);

  auto q = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!q || EC_POINT_mul(group, q.get(), d.get(), nullptr, nullptr,
                         c->ctx.get()) != 1) {
    return std::nullopt;
  }
  auto ec_key = ec_key_ptr{EC_KEY_new(), EC_KEY_free};
  if (!ec_key || EC_KEY_set_group(ec_key.get(), group) != 1 ||
      EC_KEY_set_private_key(ec_key.get(), d.get()) != 1 ||
      EC_KEY_set_public_key(ec_key.get(), q.get()) != 1) {
    return std::nullopt;
  }

  auto signature = ecdsa_sig_ptr{
      ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()),
                    ec_key.get()),
      ECDSA_SIG_free};
  if (!signature) {
    return std::nullopt;
  }
  const BIGNUM* r = nullptr;
  const BIGNUM* s_raw = nullptr;
  ECDSA_SIG_get0(signature.get(), &r, &s_raw);

  // Low-s: s > n/2 is replaced by n - s.
  auto s = bignum_ptr{BN_dup(s_raw), BN_free};
  auto half = bignum_ptr{BN_dup(n), BN_free};
  if (!s || !half || BN_rshift1(half.get(), half.get()) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(s.get(), half.get()) > 0 && BN_sub(s.get(), n, s.get()) != 1) {
    return std::nullopt;
  }

  auto out = bastion::schema::recoverable_signature_t{};
  if (!write_fixed(r, out.data()) || !write_fixed(s.get(), out.data() + 32)) {
    return std::nullopt;
  }

  auto expected = compress(*c, q.get());
  if (!expected) {
    return std::nullopt;
  }
  for (const auto v : {uint8_t{0}, uint8_t{1}}) {
    out[64] = v;
    if (recover_public_key(digest, out) == expected) {
      return out;
    }
  }
  return std::nullopt;
}

std::optional<bastion::schema::public_key_t> recover_public_key(
    const bastion::schema::hash32_t& digest,
    const bastion::schema::recoverable_signature_t& signature) {
  auto v = signature[64];
  if (v >= 27) {
    v = static_cast<uint8_t>(v - 27);
  }
  if (v > 1) {
    return std::nullopt;
  }

  auto c = make_curve();
  if (!c) {
    return std::nullopt;
  }
  auto* group = c->group.get();
  auto* ctx = c->ctx.get();
  const auto* n = c->order.get();

  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  auto e = make_bignum(digest.data(), digest.size());
  if (!r || !s || !e || !in_scalar_range(*c, r.get()) ||
      !in_scalar_range(*c, s.get())) {
    return std::nullopt;
  }
  if (BN_nnmod(e.get(), e.get(), n, ctx) != 1) {
    return std::nullopt;
  }

  // R = (r, y) with the parity carried by v.
  auto big_r = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!big_r || EC_POINT_set_compressed_coordinates(group, big_r.get(), r.get(),
                                                    v, ctx) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (s R - e G) = (-e r^-1) G + (s r^-1) R
  auto r_inverse = bignum_ptr{BN_new(), BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!r_inverse || !u1 || !u2) {
    return std::nullopt;
  }
  if (BN_mod_inverse(r_inverse.get(), r.get(), n, ctx) == nullptr ||
      BN_mod_sub(u1.get(), n, e.get(), n, ctx) != 1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inverse.get(), n, ctx) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), n, ctx) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!q || EC_POINT_mul(group, q.get(), u1.get(), big_r.get(), u2.get(),
                         ctx) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group, q.get()) == 1) {
    return std::nullopt;
  }
  return compress(*c, q.get());
}

bastion::schema::identity_t identity_of(
    const bastion::schema::public_key_t& public_key) {
  return bastion::blake3::hash(
      bastion::schema::bytes_view_t{public_key.data(), public_key.size()});
}

bastion::schema::identity_t recover_identity(
    const bastion::schema::hash32_t& digest,
    const bastion::schema::bytes_view_t& approval) {
  auto signature = bastion::schema::recoverable_signature_t{};
  if (approval.size() != signature.size()) {
    return bastion::schema::make_null_identity();
  }
  std::copy(approval.begin(), approval.end(), signature.begin());
  auto public_key = recover_public_key(digest, signature);
  if (!public_key) {
    return bastion::schema::make_null_identity();
  }
  return identity_of(*public_key);
}

}  // namespace bastion::crypto
