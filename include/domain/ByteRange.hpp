#pragma once

#include "Errors.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace hostlink::domain {

/**
 * @brief Полуоткрытый диапазон байт [start, end)
 */
struct ByteRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    std::uint64_t length() const { return end - start; }

    /**
     * @brief Разобрать заголовок "Range: bytes=s-e" (e включительно, может отсутствовать)
     *
     * Без заголовка отдаётся весь файл. Конец за пределами файла обрезается.
     * @throws ValidationError на синтаксически неверный диапазон
     * @throws RangeNotSatisfiableError если start >= fileSize
     */
    static ByteRange parse(const std::optional<std::string>& header, std::uint64_t fileSize) {
        ByteRange range{0, fileSize};
        if (header && !header->empty()) {
            const std::string prefix = "bytes=";
            if (header->compare(0, prefix.size(), prefix) != 0) {
                throw ValidationError("Invalid Range header");
            }
            std::string value = header->substr(prefix.size());
            auto dash = value.find('-');
            if (dash == std::string::npos || dash == 0) {
                throw ValidationError("Invalid Range header");
            }
            range.start = parseNumber(value.substr(0, dash));
            std::string last = value.substr(dash + 1);
            if (!last.empty()) {
                std::uint64_t inclusiveEnd = parseNumber(last);
                if (inclusiveEnd < range.start) {
                    throw ValidationError("Invalid Range header");
                }
                range.end = inclusiveEnd + 1;
            }
        }
        if (range.start >= fileSize) {
            throw RangeNotSatisfiableError("Requested range not satisfiable");
        }
        if (range.end > fileSize) {
            range.end = fileSize;
        }
        return range;
    }

    /**
     * @brief Значение Content-Range: "bytes s-e/size" (e включительно)
     */
    std::string contentRange(std::uint64_t fileSize) const {
        return "bytes " + std::to_string(start) + "-" + std::to_string(end - 1) +
               "/" + std::to_string(fileSize);
    }

private:
    static std::uint64_t parseNumber(const std::string& text) {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            throw ValidationError("Invalid Range header");
        }
        try {
            return std::stoull(text);
        } catch (const std::out_of_range&) {
            throw ValidationError("Invalid Range header");
        }
    }
};

} // namespace hostlink::domain
