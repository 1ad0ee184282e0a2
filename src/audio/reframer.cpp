#include "call_relay/audio/reframer.hpp"

#include <algorithm>

namespace call_relay::audio {

FrameSequence::iterator::iterator(const FrameSequence* owner, size_t offset)
    : owner_(owner), offset_(offset) {
    load();
}

void FrameSequence::iterator::load() {
    frame_.clear();
    if (!owner_ || !owner_->audio_ || offset_ >= owner_->audio_->size()) {
        return;
    }
    const auto& audio = *owner_->audio_;
    const auto take = std::min(owner_->frame_size_, audio.size() - offset_);
    frame_.assign(audio, offset_, take);
    frame_.resize(owner_->frame_size_, static_cast<char>(owner_->padding_byte_));
}

FrameSequence::iterator& FrameSequence::iterator::operator++() {
    offset_ += owner_->frame_size_;
    if (offset_ >= owner_->audio_->size()) {
        offset_ = owner_->audio_->size();
    }
    load();
    return *this;
}

FrameSequence::iterator FrameSequence::iterator::operator++(int) {
    iterator previous = *this;
    ++(*this);
    return previous;
}

bool FrameSequence::iterator::operator==(const iterator& other) const {
    return owner_ == other.owner_ && offset_ == other.offset_;
}

FrameSequence::FrameSequence(std::shared_ptr<const std::string> audio,
                             size_t frame_size,
                             unsigned char padding_byte)
    : audio_(std::move(audio)),
      frame_size_(frame_size),
      padding_byte_(padding_byte) {}

FrameSequence::iterator FrameSequence::begin() const {
    if (empty()) {
        return end();
    }
    return iterator(this, 0);
}

FrameSequence::iterator FrameSequence::end() const {
    return iterator(this, audio_ ? audio_->size() : 0);
}

size_t FrameSequence::size() const {
    if (!audio_ || frame_size_ == 0) {
        return 0;
    }
    return (audio_->size() + frame_size_ - 1) / frame_size_;
}

size_t FrameSequence::padding() const {
    if (empty()) {
        return 0;
    }
    const auto remainder = audio_->size() % frame_size_;
    return remainder == 0 ? 0 : frame_size_ - remainder;
}

FrameSequence reframe(std::string raw_audio, size_t frame_size, unsigned char padding_byte) {
    return FrameSequence(std::make_shared<const std::string>(std::move(raw_audio)),
                         frame_size,
                         padding_byte);
}

}
