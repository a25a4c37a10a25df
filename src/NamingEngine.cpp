#include "NamingEngine.h"

#include <QRegularExpression>
#include <QStringList>

#include <array>

namespace {

constexpr std::array<const char*, 12> kNoteNames {
    "c", "c#", "d", "d#", "e", "f", "f#", "g", "g#", "a", "a#", "b"
};

int pitchClass(int note) {
    return ((note % 12) + 12) % 12;
}

bool isTremulantWord(const QString& lower) {
    return lower == QLatin1String("tremulant") || lower == QLatin1String("trem");
}

bool isQualifier(const QString& token) {
    const QString lower = token.toLower();
    return lower == QLatin1String("sterk") || lower == QLatin1String("rijen")
        || lower == QLatin1String("rij") || lower == QLatin1String("st");
}

bool isNumeric(const QString& token) {
    static const QRegularExpression re(QStringLiteral("^\\d+(?:-\\d+)?$"));
    return re.match(token).hasMatch();
}

// "4st" / "4ST" -> "4", empty when the token is not a rank count.
QString rankCount(const QString& token) {
    static const QRegularExpression re(QStringLiteral("^(\\d+)st$"), QRegularExpression::CaseInsensitiveOption);
    const auto match = re.match(token);
    return match.hasMatch() ? match.captured(1) : QString();
}

// Keeps [A-Za-z0-9#-]; a fraction slash becomes '-'. Tokens without a letter or digit vanish.
QString cleanToken(const QString& token) {
    QString out;
    out.reserve(token.size());
    bool hasAlnum = false;
    for (const QChar c : token) {
        const char16_t u = c.unicode();
        const bool alnum = (u >= u'a' && u <= u'z') || (u >= u'A' && u <= u'Z') || (u >= u'0' && u <= u'9');
        if (alnum) {
            out.append(c);
            hasAlnum = true;
        } else if (u == u'#' || u == u'-') {
            out.append(c);
        } else if (u == u'/') {
            out.append(QLatin1Char('-'));
        }
    }
    while (out.startsWith(QLatin1Char('-')))
        out.remove(0, 1);
    while (out.endsWith(QLatin1Char('-')))
        out.chop(1);
    return hasAlnum ? out : QString();
}

QStringList splitWords(const QString& folded) {
    QString text = folded;
    text.replace(QLatin1Char('_'), QLatin1Char(' '));
    text.replace(QLatin1Char('+'), QLatin1Char(' '));
    text.remove(QLatin1Char('\''));
    text.remove(QLatin1Char('"'));
    static const QRegularExpression ws(QStringLiteral("\\s+"));
    return text.split(ws, Qt::SkipEmptyParts);
}

} // namespace

QString NamingEngine::foldToAscii(const QString& text) {
    const QString decomposed = text.normalized(QString::NormalizationForm_KD);
    QString out;
    out.reserve(decomposed.size());
    for (const QChar c : decomposed) {
        if (c.unicode() < 128)
            out.append(c);
        else if (c.isSpace())
            out.append(QLatin1Char(' '));
    }
    return out;
}

bool NamingEngine::mentionsTremulant(const QString& label) {
    for (const auto& word : splitWords(foldToAscii(label))) {
        if (isTremulantWord(cleanToken(word).toLower()))
            return true;
    }
    return false;
}

QString NamingEngine::format(const QString& label, bool tremulant) {
    bool trem = tremulant;
    QStringList words;
    for (const auto& raw : splitWords(foldToAscii(label))) {
        const QString token = cleanToken(raw);
        if (token.isEmpty())
            continue;
        if (isTremulantWord(token.toLower())) {
            trem = true;
            continue;
        }
        words << token;
    }

    QStringList parts;
    for (const auto& word : words) {
        if (word.compare(QLatin1String("voet"), Qt::CaseInsensitive) != 0)
            parts << word;
    }

    int firstRank = -1;
    for (int i = 0; i < parts.size(); ++i) {
        if (isNumeric(parts.at(i)) || !rankCount(parts.at(i)).isEmpty()) {
            firstRank = i;
            break;
        }
    }

    QString result;
    if (firstRank < 0) {
        // No pitch to anchor on: keep the label's words as typed.
        result = words.join(QLatin1Char('_'));
    } else {
        QStringList name = parts.mid(0, firstRank);
        QStringList tail;
        for (int i = firstRank; i < parts.size(); ++i) {
            const QString& token = parts.at(i);
            const QString count = rankCount(token);
            if (isNumeric(token)) {
                const bool plain = !token.contains(QLatin1Char('-'));
                if (plain && i + 1 < parts.size() && isQualifier(parts.at(i + 1))) {
                    tail << token + QStringLiteral("st");
                    ++i;
                } else {
                    tail << token;
                }
            } else if (!count.isEmpty()) {
                tail << count + QStringLiteral("st");
            } else if (isQualifier(token)) {
                continue;
            } else if (name.isEmpty()) {
                // "3 sterk Cornet": the count came first, the stop name follows.
                name << token;
            } else {
                tail << token;
            }
        }
        result = (name + tail).join(QLatin1Char('_'));
    }

    if (result.isEmpty())
        result = QStringLiteral("Register");
    if (trem)
        result += QStringLiteral("_trem");
    return result;
}

QString NamingEngine::sanitizeSegment(const QString& raw, const QString& fallback) {
    const QString folded = foldToAscii(raw).trimmed();
    QString out;
    out.reserve(folded.size());
    bool pendingSeparator = false;
    for (const QChar c : folded) {
        const char16_t u = c.unicode();
        if (c.isSpace() || u == u'_') {
            pendingSeparator = !out.isEmpty();
            continue;
        }
        const bool keep = (u >= u'a' && u <= u'z') || (u >= u'A' && u <= u'Z') || (u >= u'0' && u <= u'9')
            || u == u'#' || u == u'-' || u == u'.';
        if (!keep)
            continue;
        if (pendingSeparator)
            out.append(QLatin1Char('_'));
        pendingSeparator = false;
        out.append(c);
    }
    while (out.startsWith(QLatin1Char('.')))
        out.remove(0, 1);
    return out.isEmpty() ? fallback : out;
}

QString NamingEngine::pathFor(const RegisterLocation& location,
                              bool tremulant,
                              const std::optional<QString>& micPosition,
                              int note) {
    QStringList segments {
        sanitizeSegment(location.organ, QStringLiteral("Organ")),
        sanitizeSegment(location.keyboard, QStringLiteral("Keyboard")),
        format(location.label, tremulant)
    };
    if (micPosition)
        segments << sanitizeSegment(*micPosition, QStringLiteral("Mic"));
    segments << noteFileName(note) + QLatin1String(kSampleExtension);
    return segments.join(QLatin1Char('/'));
}

QString NamingEngine::noteFileName(int note) {
    return QStringLiteral("%1-%2")
        .arg(note, 3, 10, QLatin1Char('0'))
        .arg(QLatin1String(kNoteNames[pitchClass(note)]));
}

QString NamingEngine::noteDisplayName(int note) {
    const int octave = (note - pitchClass(note)) / 12 - 1;
    return QString::fromLatin1(kNoteNames[pitchClass(note)]).toUpper() + QString::number(octave);
}
