#pragma once

#include "Tuning.h"
#include <array>
#include <string>

namespace model {

// Rectangular single-slot clipboard: one text segment per string, all the
// same length. Every kill or copy replaces the previous contents.
class Clipboard
{
public:
    using Rectangle = std::array<std::string, Tuning::NUM_STRINGS>;

    void copy(const Rectangle& data) {
        data_ = data;
        empty_ = false;
    }

    const Rectangle& getData() const { return data_; }
    bool isEmpty() const { return empty_; }

    int getWidth() const { return empty_ ? 0 : static_cast<int>(data_[0].size()); }
    int getHeight() const { return empty_ ? 0 : Tuning::NUM_STRINGS; }

    void clear() {
        data_ = Rectangle();
        empty_ = true;
    }

private:
    Rectangle data_;
    bool empty_ = true;
};

} // namespace model
