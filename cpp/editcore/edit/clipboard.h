#ifndef EDITCORE_EDIT_CLIPBOARD_H
#define EDITCORE_EDIT_CLIPBOARD_H

#include <string>
#include <string_view>

namespace editcore::edit {

/**
 * Clipboard capability supplied by the embedding application.
 */
class Clipboard {
public:
    virtual ~Clipboard() = default;

    /** @return False if the text could not be stored */
    virtual bool setText(std::string_view text) = 0;
    virtual std::string text() const = 0;
};

/** Process-local clipboard used when the application supplies none. */
class LocalClipboard final : public Clipboard {
public:
    bool setText(std::string_view text) override {
        text_.assign(text.data(), text.size());
        return true;
    }
    std::string text() const override { return text_; }

private:
    std::string text_;
};

} // namespace editcore::edit

#endif // EDITCORE_EDIT_CLIPBOARD_H
