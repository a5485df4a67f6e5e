#pragma once

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

namespace cr {

struct NormalizedQuery {
    QString original;
    QStringList tokens;          // Canonical tokens, query order
    QString canonical;           // tokens joined by single spaces
    QStringList surfaceTokens;   // Same positions, before synonym mapping

    // Two normalizations are equal when they produce the same canonical form.
    bool operator==(const NormalizedQuery& other) const
    {
        return tokens == other.tokens && canonical == other.canonical;
    }
    bool operator!=(const NormalizedQuery& other) const { return !(*this == other); }
};

// QueryMatcher -- deterministic canonicalization and lexical similarity.
//
// Tokens are lowercased words (letters, digits, underscore, CJK). English
// stop words are dropped and each remaining token is mapped through a
// many-to-one synonym table ({show, display, ls, dir} -> list). No I/O.
class QueryMatcher {
public:
    QueryMatcher();

    NormalizedQuery normalize(const QString& query) const;

    // First 16 hex chars of SHA-256 over the sorted canonical tokens.
    QString hash(const QString& query) const;
    QString hash(const NormalizedQuery& normalized) const;

    // jaccardWeight * jaccard(canonical sets)
    //   + (1 - jaccardWeight) * lcsRatio(surface strings)
    double similarity(const QString& a, const QString& b, double jaccardWeight = 0.5) const;
    double similarity(const NormalizedQuery& a, const NormalizedQuery& b,
                      double jaccardWeight = 0.5) const;

    void addSynonyms(const QString& canonical, const QStringList& synonyms);
    QString canonicalForm(const QString& token) const;

    // Canonical verbs present plus domain tags (git, docker, nodejs, ...).
    QSet<QString> categories(const QString& query) const;

    static double jaccard(const QStringList& a, const QStringList& b);
    // 2 * LCS(a, b) / (|a| + |b|), 1.0 for two empty strings.
    static double sequenceRatio(const QString& a, const QString& b);

private:
    QHash<QString, QString> m_synonyms;   // token -> canonical
    QSet<QString> m_canonicalWords;
};

} // namespace cr
