#include "GestureRecognizer.h"
#include <algorithm>

void GestureRecognizer::add(Recognizer recognizer) {
    recognizers.push_back(std::move(recognizer));
}

void GestureRecognizer::append(const GestureRecognizer& other) {
    recognizers.insert(recognizers.end(), other.recognizers.begin(), other.recognizers.end());
}

void GestureRecognizer::reverse_priority() {
    std::reverse(recognizers.begin(), recognizers.end());
}

std::vector<FingerId> GestureRecognizer::finger_press(FingerId id, const Point& position) {
    retired_fingers.erase(id);

    TouchHistory history;
    history.push(TouchPhase::PRESS, position);
    active_fingers[id] = std::move(history);
    return check_gestures();
}

std::vector<FingerId> GestureRecognizer::finger_move(FingerId id, const Point& position) {
    if (retired_fingers.count(id)) return {};

    active_fingers[id].push(TouchPhase::MOVE, position);
    return check_gestures();
}

std::vector<FingerId> GestureRecognizer::finger_release(FingerId id, const Point& position) {
    if (retired_fingers.erase(id)) return {};

    active_fingers[id].push(TouchPhase::RELEASE, position);
    std::vector<FingerId> finished = check_gestures();
    active_fingers.erase(id);
    retired_fingers.erase(id);
    return finished;
}

std::vector<FingerId> GestureRecognizer::check_gestures() {
    std::vector<FingerId> finished;

    for (const auto& [id, history] : active_fingers) {
        for (const auto& recognizer : recognizers) {
            if (recognizer(history)) {
                finished.push_back(id);
                break;
            }
        }
    }

    // Purge after the pass so every finger sees the same set
    for (FingerId id : finished) {
        active_fingers.erase(id);
        retired_fingers.insert(id);
    }

    return finished;
}
