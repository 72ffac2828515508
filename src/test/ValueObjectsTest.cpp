#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/common/Text.hpp"
#include "domain/value_objects/Carbohydrate.hpp"
#include "domain/value_objects/ExerciseDuration.hpp"
#include "domain/value_objects/InsulinDose.hpp"
#include "domain/value_objects/LookupIds.hpp"
#include "domain/value_objects/NoteText.hpp"
#include "domain/value_objects/TirRange.hpp"
#include "domain/value_objects/UserId.hpp"

using namespace glucosetrail::domain;

static void testCarbohydrate() {
    for (int g = -5; g <= 305; ++g) {
        bool expected = g >= 0 && g <= 300;
        assert(Carbohydrate::create(g).isSuccess() == expected);
    }
    assert(Carbohydrate::create(301).error().code == "Event.InvalidCarbohydrates");
    assert(Carbohydrate::create(301).error().kind == ErrorKind::InvalidInput);
    assert(Carbohydrate::create(45).value() == Carbohydrate::create(45).value());
    assert(Carbohydrate::create(45).value().toString() == "45g");
    std::cout << "[PASS] Carbohydrate bounds." << std::endl;
}

static void testInsulinDose() {
    assert(InsulinDose::parse("10.25").isFailure());
    assert(InsulinDose::parse("10.5").isSuccess());
    assert(InsulinDose::parse("100.0").isSuccess());
    assert(InsulinDose::parse("100.5").isFailure());
    assert(InsulinDose::parse("0").isSuccess());
    assert(InsulinDose::parse("-0.5").isFailure());
    assert(InsulinDose::parse("4.50").value().halfUnits() == 9);
    assert(InsulinDose::parse("abc").isFailure());
    assert(InsulinDose::parse("").isFailure());
    assert(InsulinDose::parse(".").isFailure());
    assert(InsulinDose::parse("1e1").isFailure());
    assert(InsulinDose::parse("10.25").error().code == "Event.InvalidInsulinDose");

    assert(InsulinDose::parse(" +4.5 ").value() == InsulinDose::parse("4.5").value());
    assert(InsulinDose::parse("4.5").value().formatUnits() == "4.5");
    assert(InsulinDose::parse("10").value().formatUnits() == "10");
    assert(InsulinDose::parse("4.5").value().toString() == "4.5U");
    assert(InsulinDose::parse("4.5").value().units() == 4.5);
    assert(InsulinDose::parse("100").value().halfUnits() == InsulinDose::kMaxHalfUnits);
    std::cout << "[PASS] InsulinDose half-unit rule." << std::endl;
}

static void testExerciseDuration() {
    assert(ExerciseDuration::create(0).isFailure());
    assert(ExerciseDuration::create(1).isSuccess());
    assert(ExerciseDuration::create(300).isSuccess());
    assert(ExerciseDuration::create(301).isFailure());
    assert(ExerciseDuration::create(0).error().code == "Event.InvalidExerciseDuration");
    assert(ExerciseDuration::create(30).value().toString() == "30 min");
    std::cout << "[PASS] ExerciseDuration bounds." << std::endl;
}

static void testNoteText() {
    assert(NoteText::create("  hello  ").value().text() == "hello");
    assert(NoteText::create("").isFailure());
    assert(NoteText::create("   \t\n").isFailure());
    assert(NoteText::create(std::string(500, 'a')).isSuccess());
    assert(NoteText::create(std::string(501, 'a')).isFailure());
    assert(NoteText::create("  " + std::string(500, 'a') + "  ").isSuccess());
    assert(NoteText::create("").error().code == "Event.InvalidNoteText");

    // 500 two-byte characters are 500 characters, not 1000.
    std::string accented;
    for (int i = 0; i < 500; ++i) accented += "\xC3\xA9";
    assert(NoteText::create(accented).isSuccess());

    assert(!NoteText::createOptional("").value());
    assert(!NoteText::createOptional(" \t ").value());
    assert(!NoteText::createOptional("\xC2\xA0").value());
    assert(NoteText::createOptional(" lunch ").value()->text() == "lunch");
    auto tooLong = NoteText::createOptional(std::string(501, 'a'));
    assert(tooLong.isFailure());
    assert(tooLong.error().code == "Event.InvalidNoteText");
    assert(NoteText::createOptional("\x80").isFailure());

    std::cout << "[PASS] NoteText trimming and length." << std::endl;
}

static void testNoteTextRejectsMalformedUtf8() {
    // Stray continuation bytes would otherwise count as zero characters.
    auto stray = NoteText::create("a" + std::string(100000, '\x80'));
    assert(stray.isFailure());
    assert(stray.error().code == "Event.InvalidNoteText");

    assert(NoteText::create("caf\xC3").isFailure());               // truncated sequence
    assert(NoteText::create("\xC0\xAF").isFailure());              // overlong '/'
    assert(NoteText::create("\xED\xA0\x80").isFailure());          // surrogate
    assert(NoteText::create("\xF0\x9F\x98\x80 ok").isSuccess());    // emoji
    std::cout << "[PASS] NoteText rejects malformed UTF-8." << std::endl;
}

static void testUnicodeWhitespace() {
    const std::string nbsp = "\xC2\xA0";
    const std::string ideographic = "\xE3\x80\x80";
    assert(NoteText::create(nbsp).isFailure());
    assert(NoteText::create(nbsp + ideographic + " \t").isFailure());
    assert(NoteText::create(nbsp + "hello" + ideographic).value().text() == "hello");
    assert(text::Trim("\xE2\x80\x83x\xE2\x80\xAF") == "x");
    assert(text::IsBlank(nbsp + "\n"));
    assert(!text::IsBlank(nbsp + "."));
    // Non-space multi-byte characters at the edges stay.
    assert(text::Trim("\xC3\xA9 ") == "\xC3\xA9");
    std::cout << "[PASS] Unicode whitespace is trimmed." << std::endl;
}

static void testTirRange() {
    assert(TirRange::create(70, 180).isSuccess());
    assert(TirRange::create(100, 100).isFailure());
    assert(TirRange::create(180, 70).isFailure());
    assert(TirRange::create(-1, 180).isFailure());
    assert(TirRange::create(70, 1001).isFailure());
    assert(TirRange::create(0, 1000).isSuccess());
    assert(TirRange::create(100, 100).error().code == "User.InvalidTirRange");

    for (int lo = -2; lo <= 1002; lo += 167) {
        for (int hi = -2; hi <= 1002; hi += 143) {
            bool expected = lo >= 0 && lo <= 1000 && hi >= 0 && hi <= 1000 && lo < hi;
            assert(TirRange::create(lo, hi).isSuccess() == expected);
        }
    }

    TirRange standard = TirRange::standard();
    assert(standard == TirRange::create(70, 180).value());
    assert(standard.isInRange(70));
    assert(standard.isInRange(180));
    assert(!standard.isInRange(69));
    assert(!standard.isInRange(181));
    assert(standard.toString() == "70-180 mg/dL");
    std::cout << "[PASS] TirRange bounds." << std::endl;
}

static void testReferences() {
    bool threw = false;
    try {
        MealTagId::create(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ExerciseTypeId::create(-3);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        UserId::create("");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(MealTagId::create(2) == MealTagId::create(2));
    assert(UserId::create("abc") == UserId::create("abc"));
    assert(UserId::create("abc") != UserId::create("abd"));
    std::cout << "[PASS] Reference ids." << std::endl;
}

int main() {
    std::cout << "[Test] Starting Value Object Test..." << std::endl;
    testCarbohydrate();
    testInsulinDose();
    testExerciseDuration();
    testNoteText();
    testNoteTextRejectsMalformedUtf8();
    testUnicodeWhitespace();
    testTirRange();
    testReferences();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
