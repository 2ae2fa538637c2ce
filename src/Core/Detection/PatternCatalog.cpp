/**
 * @file PatternCatalog.cpp
 * @brief Built-in pattern definitions
 * @author Argus Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Argus Security. All rights reserved.
 *
 * Regexes are RE2 syntax and case-insensitive unless noted. Validators
 * re-check the extracted value case-sensitively against the provider's
 * documented token format.
 */

#include <Argus/Core/PatternCatalog.hpp>
#include <re2/re2.h>

namespace Argus::Core {

namespace {

using Filter = FalsePositiveFilter;

/// Context words that mark documentation or fixtures
const char* const CONTEXT_KEYWORDS[] = {
    "example", "placeholder", "test", "demo", "sample",
    "mock", "fake", "dummy", "your_key_here", "replace_with"
};

/**
 * @brief Regex filters followed by the shared context keyword filters
 */
std::vector<Filter> filters(std::initializer_list<const char*> regexes) {
    std::vector<Filter> out;
    for (const char* expr : regexes) {
        out.push_back(Filter::regex(expr));
    }
    for (const char* word : CONTEXT_KEYWORDS) {
        out.push_back(Filter::keyword(word));
    }
    return out;
}

/**
 * @brief Validator requiring the whole value to match @p shape
 */
Validator shapeValidator(const char* shape) {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_log_errors(false);
    auto regex = std::make_shared<const RE2>(shape, options);
    return [regex](std::string_view value) {
        return RE2::FullMatch(re2::StringPiece(value.data(), value.size()), *regex);
    };
}

PatternDefinition define(const char* id, const char* name, const char* category,
                         const char* severity, const char* regex, double confidence) {
    PatternDefinition def;
    def.id = id;
    def.name = name;
    def.category = category;
    def.severity = severity;
    def.regex = regex;
    def.confidence = confidence;
    return def;
}

} // anonymous namespace

// ============================================================================
// Secrets
// ============================================================================

std::vector<PatternDefinition> secretPatterns() {
    std::vector<PatternDefinition> out;

    auto openai = define("openai-api-key", "OpenAI API Key", "secrets", "critical",
        R"re((?:openai[_-]?api[_-]?key|OPENAI_API_KEY|sk-proj)[:\s='"]*(sk-[a-zA-Z0-9]{48})(?:[^a-zA-Z0-9]|$))re", 0.9);
    openai.extractGroup = 1;
    openai.minLength = 51;
    openai.falsePositiveFilters = filters({R"re(sk-[a-zA-Z0-9]{48}[a-zA-Z0-9]+)re", "example", "placeholder"});
    openai.validator = [](std::string_view v) { return v.size() == 51 && v.substr(0, 3) == "sk-"; };
    openai.description = "OpenAI secret key following an OpenAI key identifier";
    out.push_back(std::move(openai));

    auto twilioKey = define("twilio-api-key", "Twilio API Key", "secrets", "high",
        R"re((SK[a-f0-9]{32}))re", 0.85);
    twilioKey.extractGroup = 1;
    twilioKey.minLength = 34;
    twilioKey.falsePositiveFilters = filters({"example", "test", "placeholder"});
    twilioKey.validator = shapeValidator("SK[a-f0-9]{32}");
    out.push_back(std::move(twilioKey));

    auto twilioToken = define("twilio-auth-token", "Twilio Auth Token", "secrets", "high",
        R"re((AC[a-f0-9]{32}))re", 0.85);
    twilioToken.extractGroup = 1;
    twilioToken.minLength = 34;
    twilioToken.falsePositiveFilters = filters({"example", "test", "placeholder"});
    twilioToken.validator = shapeValidator("AC[a-f0-9]{32}");
    out.push_back(std::move(twilioToken));

    auto azureStorage = define("azure-storage-connection", "Azure Storage Connection String", "secrets", "critical",
        R"re((DefaultEndpointsProtocol=https;AccountName=[a-zA-Z0-9]+;AccountKey=[A-Za-z0-9+/=]+))re", 0.95);
    azureStorage.extractGroup = 1;
    azureStorage.falsePositiveFilters = filters({"example", "placeholder", "your_account", "myaccount", "test"});
    out.push_back(std::move(azureStorage));

    auto azurePrincipal = define("azure-service-principal", "Azure Service Principal Key", "secrets", "critical",
        R"re((?:azure[_-]?client[_-]?secret|AZURE_CLIENT_SECRET)[:\s='"]*([\w~-]{34,44}))re", 0.8);
    azurePrincipal.extractGroup = 1;
    azurePrincipal.falsePositiveFilters = filters({"example", "placeholder"});
    out.push_back(std::move(azurePrincipal));

    auto sendgrid = define("sendgrid-api-key", "SendGrid API Key", "secrets", "high",
        R"re((?:sendgrid[_-]?api[_-]?key|SENDGRID_API_KEY)[:\s='"]*(SG\.[A-Za-z0-9_-]{22}\.[A-Za-z0-9_-]{43}))re", 0.9);
    sendgrid.extractGroup = 1;
    sendgrid.falsePositiveFilters = filters({"example", "test"});
    sendgrid.validator = shapeValidator(R"re(SG\.[A-Za-z0-9_-]{22}\.[A-Za-z0-9_-]{43})re");
    out.push_back(std::move(sendgrid));

    auto githubPat = define("github-fine-grained-token", "GitHub Fine-grained Personal Access Token", "secrets", "high",
        R"re((github_pat_[a-zA-Z0-9]{22}_[a-zA-Z0-9]{59}))re", 0.95);
    githubPat.extractGroup = 1;
    githubPat.falsePositiveFilters = filters({"example", "placeholder"});
    githubPat.validator = shapeValidator("github_pat_[a-zA-Z0-9]{22}_[a-zA-Z0-9]{59}");
    out.push_back(std::move(githubPat));

    auto githubApp = define("github-app-token", "GitHub App Installation Token", "secrets", "high",
        R"re((?:github[_-]?app[_-]?token|GITHUB_APP_TOKEN)[:\s='"]*(ghs_[a-zA-Z0-9]{36}))re", 0.9);
    githubApp.extractGroup = 1;
    githubApp.falsePositiveFilters = filters({"example", "placeholder"});
    githubApp.validator = shapeValidator("ghs_[a-zA-Z0-9]{36}");
    out.push_back(std::move(githubApp));

    auto stripePk = define("stripe-publishable-key", "Stripe Publishable Key", "secrets", "medium",
        R"re((pk_(test|live)_[0-9a-zA-Z]{24,}))re", 0.8);
    stripePk.extractGroup = 1;
    stripePk.falsePositiveFilters = filters({"example", "placeholder"});
    stripePk.validator = shapeValidator("pk_(test|live)_[0-9a-zA-Z]{24,}");
    out.push_back(std::move(stripePk));

    auto stripeWebhook = define("stripe-webhook-secret", "Stripe Webhook Endpoint Secret", "secrets", "high",
        R"re((?:stripe[_-]?webhook[_-]?secret|STRIPE_WEBHOOK_SECRET)[:\s='"]*(whsec_[a-zA-Z0-9]{32,}))re", 0.9);
    stripeWebhook.extractGroup = 1;
    stripeWebhook.falsePositiveFilters = filters({"example", "placeholder"});
    stripeWebhook.validator = shapeValidator("whsec_[a-zA-Z0-9]{32,}");
    out.push_back(std::move(stripeWebhook));

    auto discord = define("discord-bot-token", "Discord Bot Token", "secrets", "critical",
        R"re(((?:mfa\.)?[MN][A-Za-z\d]{23}\.[\w-]{6}\.[\w-]{27}))re", 0.9);
    discord.extractGroup = 1;
    discord.falsePositiveFilters = filters({"example", "placeholder"});
    discord.validator = shapeValidator(R"re((?:mfa\.)?[MN][A-Za-z\d]{23}\.[\w-]{6}\.[\w-]{27})re");
    out.push_back(std::move(discord));

    auto notion = define("notion-api-key", "Notion API Key", "secrets", "high",
        R"re((secret_[a-zA-Z0-9]{43}))re", 0.9);
    notion.extractGroup = 1;
    notion.falsePositiveFilters = filters({"example", "placeholder"});
    notion.validator = shapeValidator("secret_[a-zA-Z0-9]{43}");
    out.push_back(std::move(notion));

    auto digitalocean = define("digitalocean-token", "DigitalOcean Personal Access Token", "secrets", "high",
        R"re((?:digitalocean[_-]?token|DO_TOKEN|DIGITALOCEAN_TOKEN)[:\s='"]*(dop_v1_[a-f0-9]{64}))re", 0.9);
    digitalocean.extractGroup = 1;
    digitalocean.falsePositiveFilters = filters({"example", "placeholder"});
    digitalocean.validator = shapeValidator("dop_v1_[a-f0-9]{64}");
    out.push_back(std::move(digitalocean));

    auto awsAccess = define("aws-access-key", "AWS Access Key ID", "secrets", "critical",
        R"re((?:aws[_-]?access[_-]?key[_-]?id|AWS_ACCESS_KEY_ID)[:\s='"]*(AKIA[0-9A-Z]{16}))re", 0.95);
    awsAccess.extractGroup = 1;
    awsAccess.falsePositiveFilters = filters({"example", "placeholder"});
    awsAccess.validator = shapeValidator("AKIA[0-9A-Z]{16}");
    out.push_back(std::move(awsAccess));

    auto awsSecret = define("aws-secret-key", "AWS Secret Access Key", "secrets", "critical",
        R"re((?:aws[_-]?secret[_-]?access[_-]?key|AWS_SECRET_ACCESS_KEY)[:\s='"]*([\w/+=]{40}))re", 0.8);
    awsSecret.extractGroup = 1;
    awsSecret.minLength = 40;
    awsSecret.maxLength = 40;
    awsSecret.falsePositiveFilters = filters({"example", "placeholder", R"re(\*{10,})re"});
    out.push_back(std::move(awsSecret));

    auto stripeSecret = define("stripe-secret-key", "Stripe Secret Key", "secrets", "critical",
        R"re((?:stripe[_-]?secret|STRIPE_SECRET_KEY)[:\s='"]*(sk_(test|live)_[0-9a-zA-Z]{24,}))re", 0.95);
    stripeSecret.extractGroup = 1;
    stripeSecret.falsePositiveFilters = filters({"example", "placeholder"});
    stripeSecret.validator = shapeValidator("sk_(test|live)_[0-9a-zA-Z]{24,}");
    out.push_back(std::move(stripeSecret));

    auto google = define("google-api-key", "Google API Key", "secrets", "high",
        R"re((?:google[_-]?api[_-]?key|GOOGLE_API_KEY)[:\s='"]*(AIza[0-9A-Za-z_-]{35}))re", 0.9);
    google.extractGroup = 1;
    google.falsePositiveFilters = filters({"example", "placeholder"});
    google.validator = shapeValidator("AIza[0-9A-Za-z_-]{35}");
    out.push_back(std::move(google));

    auto firebase = define("firebase-api-key", "Firebase API Key", "secrets", "high",
        R"re((?:firebase[_-]?api[_-]?key|apiKey|FIREBASE_API_KEY)[:\s='"]*(AIza[0-9A-Za-z_-]{35}))re", 0.85);
    firebase.extractGroup = 1;
    firebase.falsePositiveFilters = filters({"example", "placeholder"});
    out.push_back(std::move(firebase));

    return out;
}

// ============================================================================
// Vulnerabilities
// ============================================================================

std::vector<PatternDefinition> vulnerabilityPatterns() {
    std::vector<PatternDefinition> out;

    auto sql = define("sql-injection-pattern", "Potential SQL Injection Pattern", "vulnerabilities", "high",
        R"re((?:query|execute|exec)\s*\(\s*['"`].*\+.*['"`]\s*\))re", 0.7);
    sql.falsePositiveFilters = filters({R"re(console\.log)re", "debug"});
    sql.description = "String concatenation inside a query call";
    out.push_back(std::move(sql));

    auto xss = define("xss-pattern", "Potential XSS Pattern", "vulnerabilities", "medium",
        R"re(innerHTML\s*=\s*.*\+)re", 0.6);
    xss.falsePositiveFilters = filters({"sanitize", "escape"});
    xss.description = "Concatenated value assigned to innerHTML";
    out.push_back(std::move(xss));

    auto password = define("hardcoded-password", "Hardcoded Password", "vulnerabilities", "high",
        R"re((?:password|pwd|pass)[:\s='"]*([^'"\s]{8,})['"])re", 0.7);
    password.extractGroup = 1;
    password.falsePositiveFilters = filters({
        R"re(\$\{.*\})re", R"re(process\.env)re", R"re(\*{3,})re", "xxx+",
        "placeholder", "your[_-]?password", "example", "test"});
    out.push_back(std::move(password));

    return out;
}

// ============================================================================
// Configurations
// ============================================================================

std::vector<PatternDefinition> configurationPatterns() {
    std::vector<PatternDefinition> out;

    auto database = define("database-connection-string", "Database Connection String", "configurations", "critical",
        R"re(((?:mongodb|mysql|postgresql|postgres|redis)://[^:]+:[^@]+@[^/\s]+))re", 0.9);
    database.extractGroup = 1;
    database.falsePositiveFilters = filters({"example", "placeholder", "localhost"});
    out.push_back(std::move(database));

    auto privateKey = define("private-key", "Private Key", "configurations", "critical",
        R"re(-----BEGIN (?:RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----[\s\S]+?-----END (?:RSA |EC |DSA |OPENSSH )?PRIVATE KEY-----)re", 0.95);
    privateKey.caseInsensitive = false;
    privateKey.falsePositiveFilters = filters({"example", "placeholder"});
    out.push_back(std::move(privateKey));

    auto jwt = define("jwt-token", "JWT Token", "configurations", "medium",
        R"re((?:jwt[_-]?token|JWT_TOKEN|authorization)[:\s='"]*(eyJ[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+\.[A-Za-z0-9_-]+))re", 0.8);
    jwt.extractGroup = 1;
    jwt.falsePositiveFilters = filters({"example", "placeholder"});
    out.push_back(std::move(jwt));

    auto basicAuth = define("basic-auth-url", "Basic Authentication in URL", "configurations", "critical",
        R"re((https?://[A-Za-z0-9_-]+:[A-Za-z0-9_-]+@[^/\s]+))re", 0.9);
    basicAuth.extractGroup = 1;
    basicAuth.falsePositiveFilters = filters({"example", "placeholder", "user:pass"});
    out.push_back(std::move(basicAuth));

    return out;
}

std::vector<PatternDefinition> builtInPatterns() {
    auto all = secretPatterns();
    for (auto&& group : {vulnerabilityPatterns(), configurationPatterns()}) {
        all.insert(all.end(), group.begin(), group.end());
    }
    return all;
}

Result<void> registerBuiltInPatterns(PatternRegistry& registry) {
    return registry.registerPatterns(builtInPatterns());
}

} // namespace Argus::Core
