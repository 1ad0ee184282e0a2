#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>

namespace call_relay {
namespace audio {

// Lazy view over an audio buffer as fixed-size frames. The last frame is
// padded with padding_byte. Iterating again restarts from the first frame.
class FrameSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;

        reference operator*() const { return frame_; }
        pointer operator->() const { return &frame_; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class FrameSequence;
        iterator(const FrameSequence* owner, size_t offset);
        void load();

        const FrameSequence* owner_ = nullptr;
        size_t offset_ = 0;
        std::string frame_;
    };

    FrameSequence() = default;
    FrameSequence(std::shared_ptr<const std::string> audio,
                  size_t frame_size,
                  unsigned char padding_byte);

    iterator begin() const;
    iterator end() const;

    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t frame_size() const { return frame_size_; }
    // Number of padding bytes appended to the final frame.
    size_t padding() const;

private:
    std::shared_ptr<const std::string> audio_;
    size_t frame_size_ = 0;
    unsigned char padding_byte_ = 0;
};

FrameSequence reframe(std::string raw_audio, size_t frame_size, unsigned char padding_byte);

}
}
