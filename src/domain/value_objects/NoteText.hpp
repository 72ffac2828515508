/**
 * @file NoteText.hpp
 * @brief Value Object for free-text notes attached to (or forming) an event.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/DomainErrors.hpp"
#include "domain/common/Text.hpp"

namespace glucosetrail::domain {

/**
 * @class NoteText
 * @brief Trimmed text of 1 to 500 code points.
 */
class NoteText {
public:
    static constexpr std::size_t kMaxLength = 500;

    static Result<NoteText> create(const std::string& raw) {
        if (!text::IsValidUtf8(raw) || text::IsBlank(raw)) {
            return errors::InvalidNoteText();
        }
        std::string trimmed = text::Trim(raw);
        std::size_t length = text::Utf8Length(trimmed);
        if (length < 1 || length > kMaxLength) {
            return errors::InvalidNoteText();
        }
        return NoteText(std::move(trimmed));
    }

    /**
     * @brief Variant for annotations that may be left out.
     * @return An empty optional for empty or blank input; otherwise the result of create().
     */
    static Result<std::optional<NoteText>> createOptional(const std::string& raw) {
        if (text::IsValidUtf8(raw) && text::IsBlank(raw)) {
            return std::optional<NoteText>();
        }
        auto note = create(raw);
        if (note.isFailure()) return note.error();
        return std::optional<NoteText>(std::move(note).value());
    }

    const std::string& text() const { return m_text; }
    const std::string& toString() const { return m_text; }

    bool operator==(const NoteText& other) const { return m_text == other.m_text; }
    bool operator!=(const NoteText& other) const { return !(*this == other); }

private:
    explicit NoteText(std::string text) : m_text(std::move(text)) {}

    std::string m_text;
};

} // namespace glucosetrail::domain
