#pragma once

/*
    LSH ШЭЙДЕР ХОСТ САН

    ФАЙЛ: size_expression.hpp
    МОДУЛЬ: expr
    ЗОРИЛГО: Pass-ын WIDTH/HEIGHT илэрхийллийг ($WIDTH, $HEIGHT хувьсагчтай) stack bytecode руу
            compile хийж (width, height) -> бүхэл хэмжээ цэвэр функц болгоно.
            Зөвхөн тоон үйлдэл, Math.* функц/тогтмол. Гадаад орчинд хандах боломжгүй.

    ДҮРЭМ:
        expr     := additive
        additive := mul (('+' | '-') mul)*
        mul      := unary (('*' | '/' | '%') unary)*
        unary    := ('-' | '+') unary | power
        power    := primary ('**' unary)?
        primary  := number | $WIDTH | $HEIGHT | Math.CONST | Math.fn '(' args ')' | '(' expr ')'
*/


#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "lsh/core/log.hpp"
#include "lsh/core/result.hpp"

namespace lsh
{
    enum class SizeAxis : uint8_t
    {
        Width = 0,
        Height = 1
    };

    class SizeExpression
    {
    public:
        static constexpr int kMaxStackDepth = 64;
        static constexpr size_t kMaxInstructions = 256;

        enum class Op : uint8_t
        {
            PushNum,
            PushWidth,
            PushHeight,
            Add,
            Sub,
            Mul,
            Div,
            Mod,
            Pow,
            Neg,
            Call
        };

        enum class MathFn : uint8_t
        {
            Floor, Ceil, Round, Trunc, Abs, Sqrt, Cbrt, Sign,
            Exp, Log, Log2, Log10, Sin, Cos, Tan,
            Min, Max, Pow, Hypot
        };

        struct Instr
        {
            Op op = Op::PushNum;
            double num = 0.0;
            MathFn fn = MathFn::Floor;
            uint8_t argc = 0;
        };

        static Result<SizeExpression> compile(std::string_view text)
        {
            Compiler c(text);
            SizeExpression out{};
            out.source_ = std::string(text);
            if (!c.run(out.code_))
            {
                return Result<SizeExpression>::failure(
                    "size expression '" + std::string(text) + "': " + c.error());
            }
            return Result<SizeExpression>::success(std::move(out));
        }

        static SizeExpression identity(SizeAxis axis)
        {
            SizeExpression out{};
            out.source_ = axis == SizeAxis::Width ? "$WIDTH" : "$HEIGHT";
            out.code_.push_back(Instr{axis == SizeAxis::Width ? Op::PushWidth : Op::PushHeight});
            return out;
        }

        // Хоосон текст бол identity. Compile алдаа гарвал анхааруулж identity руу буцна.
        static SizeExpression compile_or_identity(std::string_view text, SizeAxis axis)
        {
            if (text.empty()) return identity(axis);
            Result<SizeExpression> r = compile(text);
            if (!r.ok)
            {
                log_warn(r.error + ", falling back to " + (axis == SizeAxis::Width ? "$WIDTH" : "$HEIGHT"));
                return identity(axis);
            }
            return std::move(r.value);
        }

        double evaluate_raw(double width, double height) const
        {
            double stack[kMaxStackDepth];
            int sp = 0;
            for (const Instr& in : code_)
            {
                switch (in.op)
                {
                    case Op::PushNum: stack[sp++] = in.num; break;
                    case Op::PushWidth: stack[sp++] = width; break;
                    case Op::PushHeight: stack[sp++] = height; break;
                    case Op::Neg: stack[sp - 1] = -stack[sp - 1]; break;
                    case Op::Add: --sp; stack[sp - 1] = stack[sp - 1] + stack[sp]; break;
                    case Op::Sub: --sp; stack[sp - 1] = stack[sp - 1] - stack[sp]; break;
                    case Op::Mul: --sp; stack[sp - 1] = stack[sp - 1] * stack[sp]; break;
                    case Op::Div: --sp; stack[sp - 1] = stack[sp - 1] / stack[sp]; break;
                    case Op::Mod: --sp; stack[sp - 1] = std::fmod(stack[sp - 1], stack[sp]); break;
                    case Op::Pow: --sp; stack[sp - 1] = std::pow(stack[sp - 1], stack[sp]); break;
                    case Op::Call:
                    {
                        sp -= in.argc;
                        stack[sp] = call(in.fn, &stack[sp], in.argc);
                        ++sp;
                        break;
                    }
                }
            }
            return sp == 1 ? stack[0] : std::numeric_limits<double>::quiet_NaN();
        }

        // Тэг рүү тайрна. Төгсгөлгүй/NaN үр дүн болон <= 0 хэмжээ 1 болно.
        int evaluate(double width, double height) const
        {
            const double v = evaluate_raw(width, height);
            if (!std::isfinite(v)) return 1;
            const double t = std::trunc(v);
            if (t < 1.0) return 1;
            if (t > (double)std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
            return (int)t;
        }

        const std::string& source() const { return source_; }
        const std::vector<Instr>& code() const { return code_; }

    private:
        static double call(MathFn fn, const double* a, int argc)
        {
            switch (fn)
            {
                case MathFn::Floor: return std::floor(a[0]);
                case MathFn::Ceil: return std::ceil(a[0]);
                case MathFn::Round: return std::floor(a[0] + 0.5);
                case MathFn::Trunc: return std::trunc(a[0]);
                case MathFn::Abs: return std::fabs(a[0]);
                case MathFn::Sqrt: return std::sqrt(a[0]);
                case MathFn::Cbrt: return std::cbrt(a[0]);
                case MathFn::Sign: return a[0] > 0.0 ? 1.0 : (a[0] < 0.0 ? -1.0 : a[0]);
                case MathFn::Exp: return std::exp(a[0]);
                case MathFn::Log: return std::log(a[0]);
                case MathFn::Log2: return std::log2(a[0]);
                case MathFn::Log10: return std::log10(a[0]);
                case MathFn::Sin: return std::sin(a[0]);
                case MathFn::Cos: return std::cos(a[0]);
                case MathFn::Tan: return std::tan(a[0]);
                case MathFn::Pow: return std::pow(a[0], a[1]);
                case MathFn::Hypot: return std::hypot(a[0], a[1]);
                case MathFn::Min:
                case MathFn::Max:
                {
                    double r = a[0];
                    for (int i = 1; i < argc; ++i)
                    {
                        if (std::isnan(a[i]) || std::isnan(r)) return std::numeric_limits<double>::quiet_NaN();
                        r = fn == MathFn::Min ? std::min(r, a[i]) : std::max(r, a[i]);
                    }
                    return r;
                }
            }
            return std::numeric_limits<double>::quiet_NaN();
        }

        enum class Tok : uint8_t
        {
            End, Number, Width, Height, MathName,
            Plus, Minus, Star, StarStar, Slash, Percent,
            LParen, RParen, Comma, Invalid
        };

        class Compiler
        {
        public:
            explicit Compiler(std::string_view text) : text_(text) {}

            bool run(std::vector<Instr>& out)
            {
                code_ = &out;
                next();
                if (tok_ == Tok::End) return fail("empty expression");
                if (!additive()) return false;
                if (tok_ != Tok::End) return fail("unexpected trailing input at offset " + std::to_string(tok_start_));
                return true;
            }

            const std::string& error() const { return error_; }

        private:
            bool fail(std::string msg)
            {
                if (error_.empty()) error_ = std::move(msg);
                return false;
            }

            bool emit(Instr in, int stack_delta)
            {
                if (code_->size() >= kMaxInstructions) return fail("expression too complex");
                depth_ += stack_delta;
                if (depth_ > kMaxStackDepth) return fail("expression nests too deeply");
                code_->push_back(in);
                return true;
            }

            void next()
            {
                while (pos_ < text_.size() && std::isspace((unsigned char)text_[pos_])) ++pos_;
                tok_start_ = pos_;
                if (pos_ >= text_.size()) { tok_ = Tok::End; return; }

                const char c = text_[pos_];
                if (std::isdigit((unsigned char)c) || (c == '.' && pos_ + 1 < text_.size() && std::isdigit((unsigned char)text_[pos_ + 1])))
                {
                    const std::string rest(text_.substr(pos_));
                    char* end = nullptr;
                    num_ = std::strtod(rest.c_str(), &end);
                    pos_ += (size_t)(end - rest.c_str());
                    tok_ = Tok::Number;
                    return;
                }
                if (c == '$' || std::isalpha((unsigned char)c) || c == '_')
                {
                    size_t end = pos_ + 1;
                    while (end < text_.size() && (std::isalnum((unsigned char)text_[end]) || text_[end] == '_' || text_[end] == '.')) ++end;
                    const std::string_view word = text_.substr(pos_, end - pos_);
                    pos_ = end;
                    if (word == "$WIDTH") { tok_ = Tok::Width; return; }
                    if (word == "$HEIGHT") { tok_ = Tok::Height; return; }
                    if (word.size() > 5 && word.substr(0, 5) == "Math.")
                    {
                        name_ = std::string(word.substr(5));
                        tok_ = Tok::MathName;
                        return;
                    }
                    name_ = std::string(word);
                    tok_ = Tok::Invalid;
                    return;
                }

                ++pos_;
                switch (c)
                {
                    case '+': tok_ = Tok::Plus; return;
                    case '-': tok_ = Tok::Minus; return;
                    case '*':
                        if (pos_ < text_.size() && text_[pos_] == '*') { ++pos_; tok_ = Tok::StarStar; return; }
                        tok_ = Tok::Star;
                        return;
                    case '/': tok_ = Tok::Slash; return;
                    case '%': tok_ = Tok::Percent; return;
                    case '(': tok_ = Tok::LParen; return;
                    case ')': tok_ = Tok::RParen; return;
                    case ',': tok_ = Tok::Comma; return;
                    default:
                        name_ = std::string(1, c);
                        tok_ = Tok::Invalid;
                        return;
                }
            }

            bool additive()
            {
                if (!mul()) return false;
                while (tok_ == Tok::Plus || tok_ == Tok::Minus)
                {
                    const Op op = tok_ == Tok::Plus ? Op::Add : Op::Sub;
                    next();
                    if (!mul()) return false;
                    if (!emit(Instr{op}, -1)) return false;
                }
                return true;
            }

            bool mul()
            {
                if (!unary()) return false;
                while (tok_ == Tok::Star || tok_ == Tok::Slash || tok_ == Tok::Percent)
                {
                    const Op op = tok_ == Tok::Star ? Op::Mul : (tok_ == Tok::Slash ? Op::Div : Op::Mod);
                    next();
                    if (!unary()) return false;
                    if (!emit(Instr{op}, -1)) return false;
                }
                return true;
            }

            // Хаалт, Math аргумент, тэмдэг бүр unary-гээр дамжина. Рекурсийн гүнийг энд хязгаарлана.
            bool unary()
            {
                if (nesting_ >= kMaxStackDepth) return fail("expression nests too deeply");
                ++nesting_;
                const bool ok = signed_operand();
                --nesting_;
                return ok;
            }

            bool signed_operand()
            {
                if (tok_ == Tok::Minus)
                {
                    next();
                    if (!unary()) return false;
                    return emit(Instr{Op::Neg}, 0);
                }
                if (tok_ == Tok::Plus)
                {
                    next();
                    return unary();
                }
                return power();
            }

            bool power()
            {
                if (!primary()) return false;
                if (tok_ == Tok::StarStar)
                {
                    next();
                    if (!unary()) return false;
                    return emit(Instr{Op::Pow}, -1);
                }
                return true;
            }

            bool primary()
            {
                switch (tok_)
                {
                    case Tok::Number:
                    {
                        Instr in{Op::PushNum};
                        in.num = num_;
                        next();
                        return emit(in, 1);
                    }
                    case Tok::Width:
                        next();
                        return emit(Instr{Op::PushWidth}, 1);
                    case Tok::Height:
                        next();
                        return emit(Instr{Op::PushHeight}, 1);
                    case Tok::LParen:
                    {
                        next();
                        if (!additive()) return false;
                        if (tok_ != Tok::RParen) return fail("missing ')'");
                        next();
                        return true;
                    }
                    case Tok::MathName:
                        return math_member();
                    case Tok::End:
                        return fail("unexpected end of expression");
                    case Tok::Invalid:
                        return fail("unknown identifier '" + name_ + "'");
                    default:
                        return fail("unexpected token at offset " + std::to_string(tok_start_));
                }
            }

            bool math_constant(const std::string& name, double& out) const
            {
                if (name == "PI") { out = 3.14159265358979323846; return true; }
                if (name == "E") { out = 2.71828182845904523536; return true; }
                if (name == "LN2") { out = 0.69314718055994530942; return true; }
                if (name == "LN10") { out = 2.30258509299404568402; return true; }
                if (name == "SQRT2") { out = 1.41421356237309504880; return true; }
                return false;
            }

            // min_args/max_args: -1 бол хязгааргүй.
            bool math_function(const std::string& name, MathFn& fn, int& min_args, int& max_args) const
            {
                struct Entry { const char* name; MathFn fn; int min_args; int max_args; };
                static const Entry kTable[] = {
                    {"floor", MathFn::Floor, 1, 1}, {"ceil", MathFn::Ceil, 1, 1},
                    {"round", MathFn::Round, 1, 1}, {"trunc", MathFn::Trunc, 1, 1},
                    {"abs", MathFn::Abs, 1, 1}, {"sqrt", MathFn::Sqrt, 1, 1},
                    {"cbrt", MathFn::Cbrt, 1, 1}, {"sign", MathFn::Sign, 1, 1},
                    {"exp", MathFn::Exp, 1, 1}, {"log", MathFn::Log, 1, 1},
                    {"log2", MathFn::Log2, 1, 1}, {"log10", MathFn::Log10, 1, 1},
                    {"sin", MathFn::Sin, 1, 1}, {"cos", MathFn::Cos, 1, 1},
                    {"tan", MathFn::Tan, 1, 1}, {"pow", MathFn::Pow, 2, 2},
                    {"hypot", MathFn::Hypot, 2, 2}, {"min", MathFn::Min, 1, -1},
                    {"max", MathFn::Max, 1, -1},
                };
                for (const Entry& e : kTable)
                {
                    if (name == e.name)
                    {
                        fn = e.fn;
                        min_args = e.min_args;
                        max_args = e.max_args;
                        return true;
                    }
                }
                return false;
            }

            bool math_member()
            {
                const std::string name = name_;
                next();

                double constant = 0.0;
                if (math_constant(name, constant))
                {
                    Instr in{Op::PushNum};
                    in.num = constant;
                    return emit(in, 1);
                }

                MathFn fn{};
                int min_args = 0;
                int max_args = 0;
                if (!math_function(name, fn, min_args, max_args)) return fail("unknown Math member '" + name + "'");
                if (tok_ != Tok::LParen) return fail("Math." + name + " must be called");
                next();

                int argc = 0;
                if (tok_ != Tok::RParen)
                {
                    for (;;)
                    {
                        if (!additive()) return false;
                        ++argc;
                        if (tok_ == Tok::Comma) { next(); continue; }
                        break;
                    }
                }
                if (tok_ != Tok::RParen) return fail("missing ')' after Math." + name + " arguments");
                next();

                if (argc < min_args || (max_args >= 0 && argc > max_args) || argc > 255)
                {
                    return fail("Math." + name + ": wrong number of arguments (" + std::to_string(argc) + ")");
                }
                Instr in{Op::Call};
                in.fn = fn;
                in.argc = (uint8_t)argc;
                return emit(in, 1 - argc);
            }

            std::string_view text_{};
            size_t pos_ = 0;
            size_t tok_start_ = 0;
            Tok tok_ = Tok::End;
            double num_ = 0.0;
            std::string name_{};
            std::string error_{};
            std::vector<Instr>* code_ = nullptr;
            int depth_ = 0;
            int nesting_ = 0;
        };

        std::string source_{};
        std::vector<Instr> code_{};
    };
}
