#pragma once

#include <string>
#include <vector>

namespace relay::utils {

/**
 * @brief Разбор заголовков Set-Cookie
 *
 * Из каждого Set-Cookie берётся только первая пара name=value,
 * атрибуты (Expires, Path, HttpOnly, ...) отбрасываются.
 *
 * @example
 * ```cpp
 * CookieParser::toCookieHeader({
 *     "session_id=abc; Expires=Wed, 21 Oct 2026 07:28:00 GMT; Path=/",
 *     "frontend_lang=en_US; Path=/"
 * });
 * // "session_id=abc; frontend_lang=en_US"
 * ```
 */
class CookieParser {
public:
    /**
     * @brief Первая пара name=value одного Set-Cookie
     * @return Пустая строка, если пары нет или имя пустое
     */
    static std::string primaryPair(const std::string& setCookie) {
        std::string pair = trim(setCookie.substr(0, setCookie.find(';')));

        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            return "";
        }
        if (trim(pair.substr(0, eq)).empty()) {
            return "";
        }
        return pair;
    }

    /**
     * @brief Значение для заголовка Cookie из всех Set-Cookie ответа
     * @return Пары через "; " или пустая строка
     */
    static std::string toCookieHeader(const std::vector<std::string>& setCookies) {
        std::string result;
        for (const auto& setCookie : setCookies) {
            auto pair = primaryPair(setCookie);
            if (pair.empty()) {
                continue;
            }
            if (!result.empty()) {
                result += "; ";
            }
            result += pair;
        }
        return result;
    }

private:
    static std::string trim(const std::string& str) {
        const char* whitespace = " \t\r\n";
        auto begin = str.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = str.find_last_not_of(whitespace);
        return str.substr(begin, end - begin + 1);
    }
};

} // namespace relay::utils
