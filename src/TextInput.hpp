#pragma once
#include <string>
#include <string_view>

// Single line text field edited through key names ("a", "space", "backspace").
struct TextInput
{
    std::string text;
    size_t maxLength = 256;

    // True when the key edited the field.
    bool handleKey(std::string_view key)
    {
        if (key == "backspace")
        {
            if (!text.empty())
            {
                // drop a whole UTF-8 sequence
                size_t n = text.size() - 1;
                while (n > 0 && (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) --n;
                text.erase(n);
            }
            return true;
        }
        if (key == "ctrl+u")
        {
            text.clear();
            return true;
        }
        if (key == "space")
            return insert(" ");
        if (isPrintable(key))
            return insert(key);
        return false;
    }

    void set(std::string v) { text = std::move(v); }
    void clear() { text.clear(); }
    bool empty() const { return text.empty(); }

    // one character, possibly multi-byte; names like "up" or "ctrl+c" are not
    static bool isPrintable(std::string_view key)
    {
        if (key.empty()) return false;
        const auto c0 = static_cast<unsigned char>(key[0]);
        if (key.size() == 1) return c0 >= 0x20 && c0 < 0x7F;
        return c0 >= 0xC0 && key.size() <= 4;
    }

private:
    bool insert(std::string_view s)
    {
        if (text.size() + s.size() > maxLength) return false;
        text.append(s);
        return true;
    }
};
