#pragma once

#include <QString>

#include <optional>

// Where a register lives; the three parts become the leading path segments.
struct RegisterLocation {
    QString organ;
    QString keyboard;
    QString label;
};

// Maps free-text register labels and MIDI notes to GrandOrgue style names and relative paths.
// Everything here is a pure function of its arguments.
class NamingEngine {
public:
    static constexpr const char* kSampleExtension = ".mp3";

    // "Holpijp 8 voet + tremulant" -> "Holpijp_8_trem", "Mixtuur 4 sterk" -> "Mixtuur_4st".
    // Idempotent: format(format(x)) == format(x).
    static QString format(const QString& label, bool tremulant = false);

    // Organ/Keyboard/<register>[/<MicPosition>]/<NNN>-<note>.mp3
    static QString pathFor(const RegisterLocation& location,
                           bool tremulant,
                           const std::optional<QString>& micPosition,
                           int note);

    static QString noteFileName(int note);     // 36 -> "036-c"
    static QString noteDisplayName(int note);  // 36 -> "C2"

    // ASCII, no whitespace, no path separators. Empty input yields |fallback|.
    static QString sanitizeSegment(const QString& raw, const QString& fallback);

    static bool mentionsTremulant(const QString& label);

private:
    static QString foldToAscii(const QString& text);
};
