#include <cmath>
#include <cstdio>
#include <string>

#include "lsh/expr/size_expression.hpp"

namespace
{
    bool eval_is(const char* text, double w, double h, int expected)
    {
        lsh::Result<lsh::SizeExpression> r = lsh::SizeExpression::compile(text);
        if (!r.ok)
        {
            std::fprintf(stderr, "[size-expression-tests] '%s' did not compile: %s\n", text, r.error.c_str());
            return false;
        }
        const int got = r.value.evaluate(w, h);
        if (got != expected)
        {
            std::fprintf(stderr, "[size-expression-tests] '%s' (%g, %g) = %d, expected %d\n", text, w, h, got, expected);
            return false;
        }
        return true;
    }

    bool test_arithmetic_and_precedence()
    {
        return eval_is("$WIDTH/2", 1280, 720, 640)
            && eval_is("$HEIGHT / 3", 720, 720, 240)
            && eval_is("$WIDTH/3", 100, 100, 33)
            && eval_is("1 + 2 * 3", 0, 0, 7)
            && eval_is("(1 + 2) * 3", 0, 0, 9)
            && eval_is("2 ** 3 ** 2", 0, 0, 512)
            && eval_is("-2 ** 2 + 8", 0, 0, 4)
            && eval_is("$WIDTH % 7", 100, 0, 2)
            && eval_is("256", 1, 1, 256)
            && eval_is("0.5 * $WIDTH + .5", 9, 0, 5);
    }

    bool test_math_members()
    {
        return eval_is("Math.floor($WIDTH / 3)", 100, 0, 33)
            && eval_is("Math.ceil($WIDTH / 3)", 100, 0, 34)
            && eval_is("Math.min($WIDTH, $HEIGHT)", 800, 600, 600)
            && eval_is("Math.max($WIDTH, $HEIGHT, 1000)", 800, 600, 1000)
            && eval_is("Math.pow(2, 10)", 0, 0, 1024)
            && eval_is("Math.sqrt($WIDTH * $HEIGHT)", 64, 16, 32)
            && eval_is("Math.round(Math.PI * 10)", 0, 0, 31)
            && eval_is("Math.hypot(3, 4)", 0, 0, 5)
            && eval_is("Math.log2(1024)", 0, 0, 10);
    }

    bool test_degenerate_results_clamp_to_one()
    {
        return eval_is("$WIDTH - 5000", 100, 100, 1)
            && eval_is("0", 100, 100, 1)
            && eval_is("$WIDTH / 0 - $WIDTH / 0", 100, 100, 1)
            && eval_is("Math.sqrt(-1)", 0, 0, 1)
            && eval_is("0.75", 0, 0, 1)
            && eval_is("1e30", 0, 0, 2147483647);
    }

    bool test_rejects_non_arithmetic_input()
    {
        const char* bad[] = {
            "",
            "window.innerWidth",
            "alert(1)",
            "$WIDTH +",
            "($WIDTH",
            "Math.random()",
            "Math.floor",
            "Math.pow(2)",
            "$WIDTH $HEIGHT",
            "$DEPTH",
            "1; 2",
        };
        for (const char* text : bad)
        {
            lsh::Result<lsh::SizeExpression> r = lsh::SizeExpression::compile(text);
            if (r.ok)
            {
                std::fprintf(stderr, "[size-expression-tests] '%s' should not compile\n", text);
                return false;
            }
            if (r.kind != lsh::ErrorKind::Configuration) return false;
        }
        return true;
    }

    bool test_compile_or_identity_falls_back()
    {
        const lsh::SizeExpression empty_w = lsh::SizeExpression::compile_or_identity("", lsh::SizeAxis::Width);
        const lsh::SizeExpression bad_h = lsh::SizeExpression::compile_or_identity("$WIDTH +", lsh::SizeAxis::Height);
        const lsh::SizeExpression good = lsh::SizeExpression::compile_or_identity("$HEIGHT*2", lsh::SizeAxis::Width);
        return empty_w.evaluate(320, 200) == 320
            && bad_h.evaluate(320, 200) == 200
            && bad_h.source() == "$HEIGHT"
            && good.evaluate(320, 200) == 400;
    }

    bool test_nesting_limit()
    {
        std::string deep{};
        for (int i = 0; i < 80; ++i) deep += "1+(";
        deep += "1";
        for (int i = 0; i < 80; ++i) deep += ")";
        lsh::Result<lsh::SizeExpression> r = lsh::SizeExpression::compile(deep);
        return !r.ok && r.error.find("too") != std::string::npos;
    }

    bool test_deep_parens_and_signs_are_rejected()
    {
        const std::string parens = std::string(200000, '(') + "1" + std::string(200000, ')');
        lsh::Result<lsh::SizeExpression> p = lsh::SizeExpression::compile(parens);
        if (p.ok || p.error != "expression nests too deeply") return false;

        const std::string signs = std::string(1000000, '+') + "$WIDTH";
        lsh::Result<lsh::SizeExpression> s = lsh::SizeExpression::compile(signs);
        if (s.ok || s.error != "expression nests too deeply") return false;

        const std::string calls = [] {
            std::string t{};
            for (int i = 0; i < 100000; ++i) t += "Math.abs(";
            t += "$WIDTH";
            for (int i = 0; i < 100000; ++i) t += ")";
            return t;
        }();
        if (lsh::SizeExpression::compile(calls).ok) return false;

        const lsh::SizeExpression fallback = lsh::SizeExpression::compile_or_identity(parens, lsh::SizeAxis::Width);
        return fallback.evaluate(640, 360) == 640
            && eval_is("((((-+-$HEIGHT))))", 0, 360, 360);
    }
}

int main()
{
    const bool ok_arith = test_arithmetic_and_precedence();
    const bool ok_math = test_math_members();
    const bool ok_clamp = test_degenerate_results_clamp_to_one();
    const bool ok_reject = test_rejects_non_arithmetic_input();
    const bool ok_fallback = test_compile_or_identity_falls_back();
    const bool ok_nesting = test_nesting_limit();
    const bool ok_deep = test_deep_parens_and_signs_are_rejected();

    if (!ok_arith) std::fprintf(stderr, "[size-expression-tests] arithmetic failed\n");
    if (!ok_math) std::fprintf(stderr, "[size-expression-tests] Math members failed\n");
    if (!ok_clamp) std::fprintf(stderr, "[size-expression-tests] clamp to one failed\n");
    if (!ok_reject) std::fprintf(stderr, "[size-expression-tests] rejection failed\n");
    if (!ok_fallback) std::fprintf(stderr, "[size-expression-tests] identity fallback failed\n");
    if (!ok_nesting) std::fprintf(stderr, "[size-expression-tests] nesting limit failed\n");
    if (!ok_deep) std::fprintf(stderr, "[size-expression-tests] deep parens and signs failed\n");

    if (!(ok_arith && ok_math && ok_clamp && ok_reject && ok_fallback && ok_nesting && ok_deep)) return 1;
    std::fprintf(stderr, "[size-expression-tests] all tests passed\n");
    return 0;
}
