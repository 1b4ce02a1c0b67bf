#pragma once

#include "IdempotencyErrors.hpp"
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <utility>

namespace idempotency::domain {

/**
 * @brief Заголовок ответа: имя - текст, значение - сырые байты
 */
struct HeaderPair {
    std::string name;
    std::string value;

    bool operator==(const HeaderPair& other) const {
        return name == other.name && value == other.value;
    }
    bool operator!=(const HeaderPair& other) const { return !(*this == other); }
};

/**
 * @brief HTTP-подобный ответ, который сохраняется и воспроизводится
 *
 * Порядок заголовков сохраняется, повторы имён допустимы.
 * Тело - непрозрачные байты, никаких преобразований кодировки.
 */
class HttpResponse {
public:
    int status = 0;
    std::vector<HeaderPair> headers;
    std::string body;

    HttpResponse() = default;

    HttpResponse(int status, std::vector<HeaderPair> headers, std::string body)
        : status(status), headers(std::move(headers)), body(std::move(body)) {}

    HttpResponse& addHeader(const std::string& name, const std::string& value) {
        headers.push_back({name, value});
        return *this;
    }

    /**
     * @brief Все значения заголовка в порядке добавления (имя без учёта регистра)
     */
    std::vector<std::string> headerValues(const std::string& name) const {
        std::vector<std::string> values;
        for (const auto& h : headers) {
            if (equalsIgnoreCase(h.name, name)) {
                values.push_back(h.value);
            }
        }
        return values;
    }

    /**
     * @brief Проверка перед сохранением
     * @throws MalformedResponse статус вне 100..599 или недопустимый заголовок
     */
    void ensureWellFormed() const {
        if (status < 100 || status > 599) {
            throw MalformedResponse("Status code " + std::to_string(status) +
                                    " is outside of the 100..599 range");
        }
        for (const auto& h : headers) {
            if (h.name.empty()) {
                throw MalformedResponse("Header name cannot be empty");
            }
            if (!std::all_of(h.name.begin(), h.name.end(), isTokenChar)) {
                throw MalformedResponse("Header name '" + h.name + "' contains invalid characters");
            }
            // HTAB и obs-text (0x80..0xFF) допустимы, прочие управляющие байты - нет
            for (unsigned char c : h.value) {
                if ((c < 0x20 && c != '\t') || c == 0x7F) {
                    throw MalformedResponse("Value of header '" + h.name + "' contains a control byte");
                }
            }
        }
    }

    bool operator==(const HttpResponse& other) const {
        return status == other.status && headers == other.headers && body == other.body;
    }
    bool operator!=(const HttpResponse& other) const { return !(*this == other); }

private:
    // tchar из RFC 7230
    static bool isTokenChar(char ch) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) return true;
        switch (c) {
            case '!': case '#': case '$': case '%': case '&': case '\'':
            case '*': case '+': case '-': case '.': case '^': case '_':
            case '`': case '|': case '~':
                return true;
            default:
                return false;
        }
    }

    static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }
};

} // namespace idempotency::domain
