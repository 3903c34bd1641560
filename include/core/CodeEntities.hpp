// Structural model extracted from source code by the parsers.
//
// These are plain value types: each ParseResult is built fresh per call,
// owned by the caller and never mutated afterwards.

#ifndef CORE_CODE_ENTITIES_HPP
#define CORE_CODE_ENTITIES_HPP

#include <optional>
#include <string>
#include <vector>

namespace CodeRisk
{
namespace core
{

/// One declared parameter, in declaration order.
struct Parameter
{
    std::string                name;
    std::optional<std::string> declaredType;    ///< Annotation / declared type as written.
    std::optional<std::string> defaultLiteral;  ///< Default value as written.
};

/**
 * @brief A function or method.
 *
 * Invariants:
 *  - endLine >= startLine (1-indexed, inclusive)
 *  - className has a value iff isMethod
 */
struct FunctionEntity
{
    std::string                name;
    int                        startLine = 1;
    int                        endLine   = 1;
    std::string                signature;
    std::vector<Parameter>     parameters;
    std::optional<std::string> returnType;
    std::string                body;
    std::vector<std::string>   decorators;   ///< Literal text, declaration order.
    std::optional<std::string> docstring;
    bool                       isAsync  = false;
    bool                       isMethod = false;
    std::optional<std::string> className;
};

/// Annotated attribute declared in a class body.
struct Attribute
{
    std::string                name;
    std::optional<std::string> declaredType;
    int                        line = 1;
};

/**
 * @brief A class (or Java/JS class declaration).
 *
 * Every entry in methods has className == name.
 */
struct ClassEntity
{
    std::string                 name;
    int                         startLine = 1;
    int                         endLine   = 1;
    std::vector<std::string>    bases;
    std::vector<FunctionEntity> methods;
    std::vector<Attribute>      attributes;
    std::optional<std::string>  docstring;
    std::vector<std::string>    decorators;
};

/// Module-level assignment to a plain name.
struct GlobalVariable
{
    std::string name;
    int         line = 1;
    std::string valueRepr;
};

/**
 * @brief Complete structural view of one snippet.
 *
 * A non-empty errors list means extraction was degraded (unsupported
 * language) or failed (syntax error); in the latter case the structural
 * sequences are empty and complexityScore is 0.
 */
struct ParseResult
{
    std::string                 language;
    std::vector<FunctionEntity> functions;     ///< Top-level functions only.
    std::vector<ClassEntity>    classes;
    std::vector<std::string>    imports;       ///< Source order, duplicates kept.
    std::vector<GlobalVariable> globalVariables;
    std::vector<std::string>    errors;
    double                      complexityScore = 0.0;   ///< In [0, 100].

    bool hasErrors() const noexcept { return !errors.empty(); }
};

} // namespace core
} // namespace CodeRisk

#endif // CORE_CODE_ENTITIES_HPP
