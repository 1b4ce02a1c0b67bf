#pragma once

#include "IdempotencyErrors.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace idempotency::domain {

/**
 * @brief Ключ идемпотентности, выбранный клиентом
 *
 * Непрозрачная строка, уникальна только в пределах владельца.
 * Создаётся только через parse().
 */
class IdempotencyKey {
public:
    // длина строго меньше MAX_LENGTH
    static constexpr std::size_t MAX_LENGTH = 50;

    static IdempotencyKey parse(std::string raw) {
        if (raw.empty()) {
            throw InvalidIdempotencyKey("The idempotency key cannot be empty");
        }
        if (raw.size() >= MAX_LENGTH) {
            throw InvalidIdempotencyKey("The idempotency key must be shorter than " +
                                        std::to_string(MAX_LENGTH) + " characters");
        }
        // колонка idempotency_key - TEXT: без NUL и только корректный UTF-8
        if (raw.find('\0') != std::string::npos) {
            throw InvalidIdempotencyKey("The idempotency key cannot contain NUL characters");
        }
        if (!isValidUtf8(raw)) {
            throw InvalidIdempotencyKey("The idempotency key must be valid UTF-8");
        }
        return IdempotencyKey(std::move(raw));
    }

    const std::string& value() const { return value_; }

    bool operator==(const IdempotencyKey& other) const { return value_ == other.value_; }
    bool operator!=(const IdempotencyKey& other) const { return value_ != other.value_; }

private:
    explicit IdempotencyKey(std::string value) : value_(std::move(value)) {}

    static bool isValidUtf8(const std::string& s) {
        std::size_t i = 0;
        while (i < s.size()) {
            auto c = static_cast<unsigned char>(s[i]);
            if (c < 0x80) {
                ++i;
                continue;
            }

            std::size_t extra = 0;
            uint32_t cp = 0;
            if (c >= 0xC2 && c <= 0xDF) {
                extra = 1;
                cp = c & 0x1F;
            } else if (c >= 0xE0 && c <= 0xEF) {
                extra = 2;
                cp = c & 0x0F;
            } else if (c >= 0xF0 && c <= 0xF4) {
                extra = 3;
                cp = c & 0x07;
            } else {
                return false;
            }

            if (i + extra >= s.size()) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                auto cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (cc & 0x3F);
            }
            // overlong, суррогаты, выше U+10FFFF
            if ((extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
                (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return false;
            }
            i += extra + 1;
        }
        return true;
    }

    std::string value_;
};

} // namespace idempotency::domain
