#pragma once

#include "TouchHistory.h"
#include <functional>
#include <map>
#include <set>
#include <vector>

// Predicate over one finger's history. True = gesture complete.
using Recognizer = std::function<bool(const TouchHistory&)>;

// Ordered recognizer set plus the live finger histories it is fed.
// Front of the list has the highest priority.
class GestureRecognizer {
private:
    std::vector<Recognizer> recognizers;
    std::map<FingerId, TouchHistory> active_fingers;
    // Matched contacts; their samples are dropped until the next press
    std::set<FingerId> retired_fingers;

    std::vector<FingerId> check_gestures();

public:
    GestureRecognizer() = default;

    void add(Recognizer recognizer);
    void append(const GestureRecognizer& other);
    void reverse_priority();

    // Each returns the finger ids whose gesture completed during the call
    std::vector<FingerId> finger_press(FingerId id, const Point& position);
    std::vector<FingerId> finger_move(FingerId id, const Point& position);
    std::vector<FingerId> finger_release(FingerId id, const Point& position);

    size_t size() const { return recognizers.size(); }
    bool empty() const { return recognizers.empty(); }
    bool is_tracking(FingerId id) const { return active_fingers.count(id) > 0; }
    bool is_retired(FingerId id) const { return retired_fingers.count(id) > 0; }
    size_t active_finger_count() const { return active_fingers.size(); }
};
