#include "vault/ui/TransientMessage.hh"

namespace vault {

void TransientMessage::show(const std::string& text, MessageTone tone, double now, double duration) {
    text_ = text;
    tone_ = tone;
    expiresAt_ = now + duration;
}

void TransientMessage::update(double now) {
    if (!text_.empty() && now >= expiresAt_) {
        clear();
    }
}

bool TransientMessage::active() const {
    return !text_.empty();
}

const std::string& TransientMessage::text() const {
    return text_;
}

MessageTone TransientMessage::tone() const {
    return tone_;
}

double TransientMessage::expiresAt() const {
    return expiresAt_;
}

void TransientMessage::clear() {
    text_.clear();
    tone_ = MessageTone::Info;
    expiresAt_ = 0.0;
}

} // namespace vault
