#include "core/match/query_matcher.h"
#include "core/shared/logging.h"

#include <QCryptographicHash>
#include <QRegularExpression>

#include <algorithm>
#include <vector>

namespace cr {

namespace {

struct SynonymGroup {
    const char* canonical;
    std::vector<const char*> synonyms;
};

// Chinese entries are written as UTF-8 and decoded with QString::fromUtf8.
const std::vector<SynonymGroup>& defaultSynonymGroups()
{
    static const std::vector<SynonymGroup> groups = {
        {"list", {"show", "display", "ls", "dir", "列出", "显示", "查看"}},
        {"create", {"make", "new", "mkdir", "touch", "创建", "新建"}},
        {"delete", {"remove", "rm", "del", "unlink", "删除", "移除"}},
        {"copy", {"cp", "duplicate", "复制", "拷贝"}},
        {"move", {"mv", "rename", "移动", "重命名"}},
        {"find", {"search", "locate", "grep", "查找", "搜索"}},
        {"install", {"add", "setup", "安装", "添加"}},
        {"update", {"upgrade", "refresh", "更新", "升级"}},
        {"start", {"run", "execute", "launch", "启动", "运行"}},
        {"stop", {"kill", "terminate", "halt", "停止", "终止"}},
        {"status", {"check", "info", "state", "状态", "检查"}},
        {"download", {"fetch", "get", "pull", "下载", "获取"}},
        {"upload", {"push", "send", "上传", "发送"}},
        {"connect", {"link", "join", "连接", "链接"}},
        {"all", {"everything", "total", "全部", "所有"}},
        {"current", {"now", "present", "当前", "现在"}},
        {"recursive", {"r", "deep", "递归", "深度"}},
        {"force", {"f", "overwrite", "强制", "覆盖"}},
    };
    return groups;
}

const QSet<QString>& stopWords()
{
    static const QSet<QString> words = {
        QStringLiteral("a"), QStringLiteral("an"), QStringLiteral("the"),
        QStringLiteral("is"), QStringLiteral("are"), QStringLiteral("was"),
        QStringLiteral("were"), QStringLiteral("be"), QStringLiteral("been"),
        QStringLiteral("being"), QStringLiteral("have"), QStringLiteral("has"),
        QStringLiteral("had"), QStringLiteral("do"), QStringLiteral("does"),
        QStringLiteral("did"), QStringLiteral("will"), QStringLiteral("would"),
        QStringLiteral("could"), QStringLiteral("should"), QStringLiteral("may"),
        QStringLiteral("might"), QStringLiteral("can"), QStringLiteral("must"),
        QStringLiteral("shall"), QStringLiteral("to"), QStringLiteral("of"),
        QStringLiteral("in"), QStringLiteral("on"), QStringLiteral("at"),
        QStringLiteral("by"), QStringLiteral("for"), QStringLiteral("with"),
        QStringLiteral("from"), QStringLiteral("up"), QStringLiteral("about"),
        QStringLiteral("into"), QStringLiteral("through"), QStringLiteral("during"),
        QStringLiteral("before"), QStringLiteral("after"), QStringLiteral("above"),
        QStringLiteral("below"), QStringLiteral("between"), QStringLiteral("among"),
        QStringLiteral("under"), QStringLiteral("over"), QStringLiteral("out"),
        QStringLiteral("off"), QStringLiteral("down"), QStringLiteral("so"),
        QStringLiteral("but"), QStringLiteral("and"), QStringLiteral("or"),
        QStringLiteral("not"), QStringLiteral("no"), QStringLiteral("nor"),
        QStringLiteral("as"), QStringLiteral("if"), QStringLiteral("than"),
        QStringLiteral("then"), QStringLiteral("now"), QStringLiteral("here"),
        QStringLiteral("there"), QStringLiteral("when"), QStringLiteral("where"),
        QStringLiteral("why"), QStringLiteral("how"), QStringLiteral("what"),
        QStringLiteral("which"), QStringLiteral("who"), QStringLiteral("whom"),
        QStringLiteral("this"), QStringLiteral("that"), QStringLiteral("these"),
        QStringLiteral("those"), QStringLiteral("my"), QStringLiteral("your"),
        QStringLiteral("his"), QStringLiteral("her"), QStringLiteral("its"),
        QStringLiteral("our"), QStringLiteral("their"),
    };
    return words;
}

struct DomainTag {
    const char* tag;
    std::vector<const char*> keywords;
};

const std::vector<DomainTag>& domainTags()
{
    static const std::vector<DomainTag> tags = {
        {"git", {"git", "repository", "repo", "commit"}},
        {"docker", {"docker", "container", "image"}},
        {"nodejs", {"npm", "node", "package.json"}},
        {"python", {"python", "pip", "requirements"}},
        {"network", {"ssh", "scp", "rsync"}},
        {"text_processing", {"log", "grep", "awk", "sed"}},
    };
    return tags;
}

const QRegularExpression& tokenPattern()
{
    static const QRegularExpression pattern(
        QStringLiteral("[\\w\\x{4e00}-\\x{9fff}]+"),
        QRegularExpression::UseUnicodePropertiesOption);
    return pattern;
}

QString hashText(const QString& text)
{
    const QByteArray digest = QCryptographicHash::hash(text.toUtf8(),
                                                       QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex().left(16));
}

} // namespace

QueryMatcher::QueryMatcher()
{
    for (const SynonymGroup& group : defaultSynonymGroups()) {
        QStringList synonyms;
        for (const char* word : group.synonyms) {
            synonyms.append(QString::fromUtf8(word));
        }
        addSynonyms(QString::fromUtf8(group.canonical), synonyms);
    }
}

void QueryMatcher::addSynonyms(const QString& canonical, const QStringList& synonyms)
{
    const QString key = canonical.toLower();
    if (key.isEmpty()) {
        return;
    }

    m_canonicalWords.insert(key);
    m_synonyms.insert(key, key);
    for (const QString& synonym : synonyms) {
        const QString word = synonym.toLower();
        if (word.isEmpty() || m_canonicalWords.contains(word)) {
            // A canonical word never maps onto another one.
            continue;
        }
        const auto existing = m_synonyms.constFind(word);
        if (existing != m_synonyms.constEnd() && existing.value() != key) {
            LOG_DEBUG(crMatch, "Synonym '%s' remapped from '%s' to '%s'",
                      qUtf8Printable(word), qUtf8Printable(existing.value()),
                      qUtf8Printable(key));
        }
        m_synonyms.insert(word, key);
    }
}

QString QueryMatcher::canonicalForm(const QString& token) const
{
    return m_synonyms.value(token, token);
}

NormalizedQuery QueryMatcher::normalize(const QString& query) const
{
    NormalizedQuery result;
    result.original = query;

    const QString lowered = query.toLower();
    QRegularExpressionMatchIterator it = tokenPattern().globalMatch(lowered);
    while (it.hasNext()) {
        const QString token = it.next().captured(0);
        if (stopWords().contains(token)) {
            continue;
        }
        result.surfaceTokens.append(token);
        result.tokens.append(canonicalForm(token));
    }

    result.canonical = result.tokens.join(QLatin1Char(' '));
    return result;
}

QString QueryMatcher::hash(const QString& query) const
{
    return hash(normalize(query));
}

QString QueryMatcher::hash(const NormalizedQuery& normalized) const
{
    if (normalized.tokens.isEmpty()) {
        // Nothing survived normalization ("the", "?!"): key on the raw text.
        return hashText(normalized.original.toLower().simplified());
    }

    QStringList sorted = normalized.tokens;
    std::sort(sorted.begin(), sorted.end());
    return hashText(sorted.join(QLatin1Char(' ')));
}

double QueryMatcher::similarity(const QString& a, const QString& b, double jaccardWeight) const
{
    return similarity(normalize(a), normalize(b), jaccardWeight);
}

double QueryMatcher::similarity(const NormalizedQuery& a, const NormalizedQuery& b,
                                double jaccardWeight) const
{
    if (a.tokens.isEmpty() && b.tokens.isEmpty()) {
        return 1.0;
    }
    if (a.tokens.isEmpty() || b.tokens.isEmpty()) {
        return 0.0;
    }

    const double weight = std::clamp(jaccardWeight, 0.0, 1.0);
    const double setScore = jaccard(a.tokens, b.tokens);
    const double sequenceScore = sequenceRatio(a.surfaceTokens.join(QLatin1Char(' ')),
                                               b.surfaceTokens.join(QLatin1Char(' ')));
    const double combined = weight * setScore + (1.0 - weight) * sequenceScore;
    return std::clamp(combined, 0.0, 1.0);
}

double QueryMatcher::jaccard(const QStringList& a, const QStringList& b)
{
    const QSet<QString> setA(a.begin(), a.end());
    const QSet<QString> setB(b.begin(), b.end());
    if (setA.isEmpty() && setB.isEmpty()) {
        return 1.0;
    }

    int intersection = 0;
    for (const QString& token : setA) {
        if (setB.contains(token)) {
            ++intersection;
        }
    }
    const int unionSize = setA.size() + setB.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

double QueryMatcher::sequenceRatio(const QString& a, const QString& b)
{
    const int total = a.size() + b.size();
    if (total == 0) {
        return 1.0;
    }

    // Two-row LCS table.
    std::vector<int> previous(static_cast<size_t>(b.size()) + 1, 0);
    std::vector<int> current(previous.size(), 0);
    for (int i = 1; i <= a.size(); ++i) {
        for (int j = 1; j <= b.size(); ++j) {
            if (a.at(i - 1) == b.at(j - 1)) {
                current[j] = previous[j - 1] + 1;
            } else {
                current[j] = std::max(previous[j], current[j - 1]);
            }
        }
        std::swap(previous, current);
    }

    const int lcs = previous[static_cast<size_t>(b.size())];
    return 2.0 * static_cast<double>(lcs) / static_cast<double>(total);
}

QSet<QString> QueryMatcher::categories(const QString& query) const
{
    QSet<QString> result;

    const NormalizedQuery normalized = normalize(query);
    for (const QString& token : normalized.tokens) {
        if (m_canonicalWords.contains(token)) {
            result.insert(token);
        }
    }

    const QString lowered = query.toLower();
    for (const DomainTag& tag : domainTags()) {
        for (const char* keyword : tag.keywords) {
            if (lowered.contains(QLatin1String(keyword))) {
                result.insert(QString::fromLatin1(tag.tag));
                break;
            }
        }
    }
    return result;
}

} // namespace cr
