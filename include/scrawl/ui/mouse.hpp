// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <ostream>
#include <string_view>
#include <utility>
#include <vector>

#include <Imath/ImathVec.h>

#include "scrawl/ui/enums.hpp"

namespace scrawl {
namespace ui {

    struct Signature {

        enum Button { None = 0, Left = 1, Right = 2, Middle = 4 };

        enum Modifier {
            NoModifier        = 0x0,
            ShiftModifier     = 1 << 0,
            ControlModifier   = 1 << 1,
            AltModifier       = 1 << 2,
            MetaModifier      = 1 << 3,
            PanActionModifier = 1 << 7
        };

        enum InputType {
            UnknownInput = 0x0000,
            Mouse        = 0x0001,
            TouchScreen  = 0x0002,
            Stylus       = 0x0010
        };

        enum PointerType { UnknownPointer = 0x0000, Generic = 0x0001, Finger = 0x0002, Pen = 0x0004 };

        Signature(
            const EventType type           = EventType::Move,
            const Button buttons           = Button::None,
            const int modifiers            = Modifier::NoModifier,
            const InputType input_type     = InputType::UnknownInput,
            const PointerType pointer_type = PointerType::UnknownPointer)
            : type_(type),
              buttons_(buttons),
              modifiers_(modifiers),
              input_type_(input_type),
              pointer_type_(pointer_type) {}

        Signature(const Signature &o) = default;
        Signature &operator=(const Signature &o) = default;

        bool operator==(const Signature &o) const {
            return type_ == o.type_ && buttons_ == o.buttons_ && modifiers_ == o.modifiers_ &&
                   input_type_ == o.input_type_ && pointer_type_ == o.pointer_type_;
        }

        static constexpr std::string_view Signature_InputType_to_str(Signature::InputType t) {
            switch (t) {
            case Signature::InputType::UnknownInput:
                return "UnknownInput";
            case Signature::InputType::Mouse:
                return "Mouse";
            case Signature::InputType::TouchScreen:
                return "TouchScreen";
            case Signature::InputType::Stylus:
                return "Stylus";
            }
            return "Undefined";
        }

        EventType type_;
        int buttons_;
        int modifiers_;
        int input_type_;
        int pointer_type_;
    };


    /* Class PointerEvent
    A pointer or touch event in device pixels, relative to the top left of
    the host window. For touch input contacts() holds the position of every
    finger currently down, the primary contact first. Mouse and stylus
    events carry no contacts. */
    class PointerEvent {

      public:
        PointerEvent(const PointerEvent &o) = default;

        PointerEvent(
            EventType t                     = EventType::Move,
            Signature::Button b             = Signature::Button::None,
            float x                         = 0.0f,
            float y                         = 0.0f,
            int m                           = Signature::Modifier::NoModifier,
            Signature::InputType itp        = Signature::InputType::Mouse,
            std::vector<Imath::V2f> contacts = {},
            float pressure                  = 1.0f,
            double timestamp                = 0.0,
            Signature::PointerType ptp      = Signature::PointerType::Generic)
            : signature_(t, b, m, itp, ptp),
              position_(x, y),
              contacts_(std::move(contacts)),
              pressure_(pressure),
              timestamp_(timestamp) {}

        PointerEvent &operator=(const PointerEvent &o) = default;

        // Touch event where the first contact is the primary position
        static PointerEvent
        Touch(EventType t, const std::vector<Imath::V2f> &contacts, double timestamp = 0.0) {
            const Imath::V2f p = contacts.empty() ? Imath::V2f(0.0f, 0.0f) : contacts.front();
            return PointerEvent(
                t,
                Signature::Button::Left,
                p.x,
                p.y,
                Signature::Modifier::NoModifier,
                Signature::InputType::TouchScreen,
                contacts,
                1.0f,
                timestamp,
                Signature::PointerType::Finger);
        }

        bool operator==(const PointerEvent &other) const {
            return signature_ == other.signature_ && position_ == other.position_ &&
                   contacts_ == other.contacts_ && pressure_ == other.pressure_ &&
                   timestamp_ == other.timestamp_;
        }

        friend std::ostream &operator<<(std::ostream &out, const PointerEvent &o) {
            out << "PointerEvent " << EventType_to_str(o.type()) << " " << o.buttons() << " "
                << o.modifiers() << " " << o.position_.x << " " << o.position_.y << " "
                << o.contacts_.size() << " " << o.pressure_ << " " << o.timestamp_ << " "
                << Signature::Signature_InputType_to_str(
                       static_cast<Signature::InputType>(o.input_type()));
            return out;
        }

        [[nodiscard]] float x() const { return position_.x; }
        [[nodiscard]] float y() const { return position_.y; }
        [[nodiscard]] const Imath::V2f &position() const { return position_; }
        [[nodiscard]] const std::vector<Imath::V2f> &contacts() const { return contacts_; }
        [[nodiscard]] size_t num_contacts() const { return contacts_.size(); }
        [[nodiscard]] bool is_multi_touch() const { return contacts_.size() > 1; }
        [[nodiscard]] EventType type() const { return signature_.type_; }
        [[nodiscard]] int buttons() const { return signature_.buttons_; }
        [[nodiscard]] int modifiers() const { return signature_.modifiers_; }
        [[nodiscard]] const Signature &signature() const { return signature_; }
        [[nodiscard]] float pressure() const { return pressure_; }
        [[nodiscard]] double timestamp() const { return timestamp_; }
        [[nodiscard]] int input_type() const { return signature_.input_type_; }
        [[nodiscard]] int pointer_type() const { return signature_.pointer_type_; }

        [[nodiscard]] bool has_modifier(const Signature::Modifier m) const {
            return (signature_.modifiers_ & m) != 0;
        }

      private:
        Signature signature_;
        Imath::V2f position_;
        std::vector<Imath::V2f> contacts_;
        float pressure_;
        double timestamp_;
    };

} // namespace ui
} // namespace scrawl
