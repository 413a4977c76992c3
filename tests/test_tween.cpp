#include <catch2/catch.hpp>

#include <glm/glm.hpp>

#include "Tween.h"

TEST_CASE("Easing curves hit their endpoints", "[tween]") {
    for (Ease e : {Ease::LINEAR, Ease::OUT_QUAD, Ease::OUT_CUBIC, Ease::IN_OUT_CUBIC}) {
        CHECK(ApplyEase(0.0f, e) == Approx(0.0f));
        CHECK(ApplyEase(1.0f, e) == Approx(1.0f));
    }
    CHECK(ApplyEase(0.5f, Ease::OUT_QUAD) == Approx(0.75f));
    CHECK(ApplyEase(0.5f, Ease::OUT_CUBIC) == Approx(0.875f));
    CHECK(ApplyEase(0.5f, Ease::IN_OUT_CUBIC) == Approx(0.5f));
    CHECK(ApplyEase(0.25f, Ease::IN_OUT_CUBIC) == Approx(0.0625f));

    // 超出范围时截断
    CHECK(ApplyEase(-1.0f, Ease::LINEAR) == Approx(0.0f));
    CHECK(ApplyEase(2.0f, Ease::OUT_CUBIC) == Approx(1.0f));
}

TEST_CASE("Tween advances and finishes on target", "[tween]") {
    Tween<float> t(0.0f);
    t.To(10.0f, 1.0f, Ease::LINEAR);
    REQUIRE(t.IsActive());

    t.Update(0.25f);
    CHECK(t.Value() == Approx(2.5f));

    t.Update(1.0f);
    CHECK(t.Value() == Approx(10.0f));
    CHECK_FALSE(t.IsActive());
}

TEST_CASE("Retargeting starts from the current value", "[tween]") {
    Tween<float> t(0.0f);
    t.To(1.0f, 1.0f, Ease::LINEAR);
    t.Update(0.5f);
    REQUIRE(t.Value() == Approx(0.5f));

    t.To(0.0f, 1.0f, Ease::LINEAR);
    CHECK(t.Value() == Approx(0.5f));
    t.Update(0.5f);
    CHECK(t.Value() == Approx(0.25f));
    CHECK(t.Target() == Approx(0.0f));
}

TEST_CASE("Cancel holds the current value", "[tween]") {
    Tween<float> t(0.0f);
    t.To(4.0f, 2.0f, Ease::LINEAR);
    t.Update(1.0f);
    t.Cancel();
    t.Update(5.0f);
    CHECK_FALSE(t.IsActive());
    CHECK(t.Value() == Approx(2.0f));
}

TEST_CASE("Zero duration applies immediately", "[tween]") {
    Tween<float> t(1.0f);
    t.To(3.0f, 0.0f, Ease::OUT_QUAD);
    CHECK_FALSE(t.IsActive());
    CHECK(t.Value() == Approx(3.0f));
}

TEST_CASE("Vector tween moves every component", "[tween]") {
    Tween<glm::vec3> t(glm::vec3(0.0f));
    t.To(glm::vec3(2.0f, -2.0f, 4.0f), 0.2f, Ease::OUT_QUAD);
    t.Update(0.1f);
    CHECK(t.Value().x == Approx(1.5f));
    CHECK(t.Value().y == Approx(-1.5f));
    CHECK(t.Value().z == Approx(3.0f));
    t.Update(0.1f);
    CHECK(t.Value().x == Approx(2.0f));
}
