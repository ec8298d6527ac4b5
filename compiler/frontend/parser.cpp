#include "parser.hpp"

#include <charconv>
#include <string>

namespace badlang::frontend
{
    Parser::Parser(const std::vector<Token>& tokens)
        : m_tokens(tokens)
    {
    }

    Program Parser::parse()
    {
        m_current = 0;
        m_diagnostics.clear();

        Program program{};
        if (m_tokens.empty() || m_tokens.back().kind != TokenKind::EndOfFile)
        {
            fail("BAD-E2100", "Token stream does not end with end of file.", SourceSpan{});
            return program;
        }

        while (!isAtEnd())
        {
            StatementPtr statement = parseDeclaration(true);
            if (!statement)
            {
                program.statements.clear();
                return program;
            }
            program.statements.emplace_back(std::move(statement));
        }

        return program;
    }

    const std::vector<Diagnostic>& Parser::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    const Token& Parser::peek() const
    {
        return m_tokens[m_current];
    }

    const Token& Parser::peekNext() const
    {
        if (m_current + 1 >= m_tokens.size())
        {
            return m_tokens.back();
        }
        return m_tokens[m_current + 1];
    }

    const Token& Parser::previous() const
    {
        return m_tokens[m_current - 1];
    }

    const Token& Parser::advance()
    {
        if (!isAtEnd())
        {
            ++m_current;
        }

        const std::size_t index = (m_current == 0) ? 0 : (m_current - 1);
        return m_tokens[index];
    }

    bool Parser::isAtEnd() const
    {
        return peek().kind == TokenKind::EndOfFile;
    }

    bool Parser::check(TokenKind kind) const
    {
        if (isAtEnd()) return false;
        return peek().kind == kind;
    }

    bool Parser::checkType() const
    {
        return check(TokenKind::KeywordInt) || check(TokenKind::KeywordBool);
    }

    bool Parser::match(TokenKind kind)
    {
        if (check(kind))
        {
            advance();
            return true;
        }
        return false;
    }

    const Token* Parser::consume(TokenKind kind, std::string_view messageCode, std::string_view expected)
    {
        if (check(kind))
        {
            return &advance();
        }

        fail(messageCode, expected, peek());
        return nullptr;
    }

    void Parser::fail(std::string_view code, std::string_view expected, const Token& found)
    {
        std::string message = "Expected ";
        message += expected;
        message += ", but got ";
        if (found.kind == TokenKind::EndOfFile)
        {
            message += "end of file";
        }
        else
        {
            message += "'" + found.text + "'";
        }
        message += ".";
        fail(code, message, found.span);
    }

    void Parser::fail(std::string_view code, std::string_view message, SourceSpan span)
    {
        if (!m_diagnostics.empty())
        {
            return;
        }

        Diagnostic diag;
        diag.code = std::string{code};
        diag.message = std::string{message};
        diag.span = span;
        m_diagnostics.emplace_back(std::move(diag));
    }

    SourceSpan Parser::spanFrom(const Token& begin, const Token& end) const
    {
        SourceSpan span{};
        span.begin = begin.span.begin;
        span.end = end.span.end;
        return span;
    }

    SourceSpan Parser::mergeSpans(const SourceSpan& a, const SourceSpan& b) const
    {
        return SourceSpan{a.begin, b.end};
    }

    StatementPtr Parser::parseDeclaration(bool topLevel)
    {
        if (check(TokenKind::KeywordFun))
        {
            if (!topLevel)
            {
                fail("BAD-E2101", "Nested functions are not supported.", peek().span);
                return nullptr;
            }
            return parseFunction();
        }

        if (checkType())
        {
            return parseVariable();
        }

        return parseStatement();
    }

    bool Parser::parseType(ScalarType& type)
    {
        if (match(TokenKind::KeywordInt))
        {
            type = ScalarType::Integer;
            return true;
        }
        if (match(TokenKind::KeywordBool))
        {
            type = ScalarType::Boolean;
            return true;
        }

        fail("BAD-E2102", "type 'int' or 'bool'", peek());
        return false;
    }

    StatementPtr Parser::parseFunction()
    {
        const Token& keyword = advance(); // consume 'fun'

        auto function = std::make_unique<Statement>();
        function->kind = StatementKind::Function;
        if (!parseType(function->type))
        {
            return nullptr;
        }

        const Token* name = consume(TokenKind::Identifier, "BAD-E2103", "function name");
        if (name == nullptr)
        {
            return nullptr;
        }
        function->name = name->text;

        if (consume(TokenKind::LeftParen, "BAD-E2104", "'('") == nullptr)
        {
            return nullptr;
        }

        if (!check(TokenKind::RightParen))
        {
            do
            {
                Parameter parameter;
                if (!parseType(parameter.type))
                {
                    return nullptr;
                }
                const Token* parameterName = consume(TokenKind::Identifier, "BAD-E2105", "parameter name");
                if (parameterName == nullptr)
                {
                    return nullptr;
                }
                parameter.name = parameterName->text;
                parameter.span = parameterName->span;
                function->parameters.emplace_back(std::move(parameter));
            } while (match(TokenKind::Comma));
        }

        const Token* closing = consume(TokenKind::RightParen, "BAD-E2106", "')' after parameter list");
        if (closing == nullptr)
        {
            return nullptr;
        }
        function->headerSpan = spanFrom(*name, *closing);

        if (consume(TokenKind::LeftBrace, "BAD-E2107", "'{' before function body") == nullptr)
        {
            return nullptr;
        }

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            StatementPtr statement = parseDeclaration(false);
            if (!statement)
            {
                return nullptr;
            }
            function->body.emplace_back(std::move(statement));
        }

        const Token* end = consume(TokenKind::RightBrace, "BAD-E2108", "'}' after function body");
        if (end == nullptr)
        {
            return nullptr;
        }

        function->span = spanFrom(keyword, *end);
        return function;
    }

    StatementPtr Parser::parseVariable()
    {
        const Token& typeToken = peek();

        auto variable = std::make_unique<Statement>();
        variable->kind = StatementKind::Variable;
        if (!parseType(variable->type))
        {
            return nullptr;
        }

        const Token* name = consume(TokenKind::Identifier, "BAD-E2109", "variable name");
        if (name == nullptr)
        {
            return nullptr;
        }
        variable->name = name->text;
        variable->headerSpan = name->span;

        if (match(TokenKind::Equals))
        {
            variable->expression = parseExpression();
            if (!variable->expression)
            {
                return nullptr;
            }
        }

        const Token* end = consume(TokenKind::Semicolon, "BAD-E2110", "';' after variable declaration");
        if (end == nullptr)
        {
            return nullptr;
        }

        variable->span = spanFrom(typeToken, *end);
        return variable;
    }

    StatementPtr Parser::parseStatement()
    {
        switch (peek().kind)
        {
        case TokenKind::LeftBrace:
            return parseBlock();
        case TokenKind::KeywordIf:
            return parseIf();
        case TokenKind::KeywordWhile:
            return parseWhile();
        case TokenKind::KeywordReturn:
            return parseReturn();
        case TokenKind::KeywordPrint:
            return parsePrint(StatementKind::Print, true);
        case TokenKind::KeywordPrintSpace:
            return parsePrint(StatementKind::PrintSpace, false);
        case TokenKind::KeywordPrintLine:
            return parsePrint(StatementKind::PrintLine, false);
        case TokenKind::Identifier:
            if (peekNext().kind == TokenKind::Equals)
            {
                return parseAssignment();
            }
            return parseExpressionStatement();
        default:
            return parseExpressionStatement();
        }
    }

    StatementPtr Parser::parseBlock()
    {
        const Token& open = advance(); // consume '{'

        auto block = std::make_unique<Statement>();
        block->kind = StatementKind::Block;

        while (!check(TokenKind::RightBrace) && !isAtEnd())
        {
            StatementPtr statement = parseDeclaration(false);
            if (!statement)
            {
                return nullptr;
            }
            block->body.emplace_back(std::move(statement));
        }

        const Token* close = consume(TokenKind::RightBrace, "BAD-E2111", "'}' after block");
        if (close == nullptr)
        {
            return nullptr;
        }

        block->span = spanFrom(open, *close);
        return block;
    }

    StatementPtr Parser::parseIf()
    {
        const Token& keyword = advance(); // consume 'if'

        auto statement = std::make_unique<Statement>();
        statement->kind = StatementKind::If;

        if (consume(TokenKind::LeftParen, "BAD-E2112", "'(' after 'if'") == nullptr)
        {
            return nullptr;
        }
        statement->expression = parseExpression();
        if (!statement->expression)
        {
            return nullptr;
        }
        if (consume(TokenKind::RightParen, "BAD-E2113", "')' after condition") == nullptr)
        {
            return nullptr;
        }

        statement->thenBranch = parseDeclaration(false);
        if (!statement->thenBranch)
        {
            return nullptr;
        }

        if (match(TokenKind::KeywordElse))
        {
            statement->elseBranch = parseDeclaration(false);
            if (!statement->elseBranch)
            {
                return nullptr;
            }
        }

        statement->span = spanFrom(keyword, previous());
        return statement;
    }

    StatementPtr Parser::parseWhile()
    {
        const Token& keyword = advance(); // consume 'while'

        auto statement = std::make_unique<Statement>();
        statement->kind = StatementKind::While;

        if (consume(TokenKind::LeftParen, "BAD-E2112", "'(' after 'while'") == nullptr)
        {
            return nullptr;
        }
        statement->expression = parseExpression();
        if (!statement->expression)
        {
            return nullptr;
        }
        if (consume(TokenKind::RightParen, "BAD-E2113", "')' after condition") == nullptr)
        {
            return nullptr;
        }

        statement->loopBody = parseDeclaration(false);
        if (!statement->loopBody)
        {
            return nullptr;
        }

        statement->span = spanFrom(keyword, previous());
        return statement;
    }

    StatementPtr Parser::parseReturn()
    {
        const Token& keyword = advance(); // consume 'return'

        auto statement = std::make_unique<Statement>();
        statement->kind = StatementKind::Return;
        statement->expression = parseExpression();
        if (!statement->expression)
        {
            return nullptr;
        }

        const Token* end = consume(TokenKind::Semicolon, "BAD-E2110", "';' after return value");
        if (end == nullptr)
        {
            return nullptr;
        }

        statement->span = spanFrom(keyword, *end);
        return statement;
    }

    StatementPtr Parser::parsePrint(StatementKind kind, bool valueRequired)
    {
        const Token& keyword = advance(); // consume print keyword

        auto statement = std::make_unique<Statement>();
        statement->kind = kind;
        if (valueRequired || !check(TokenKind::Semicolon))
        {
            statement->expression = parseExpression();
            if (!statement->expression)
            {
                return nullptr;
            }
        }

        const Token* end = consume(TokenKind::Semicolon, "BAD-E2110", "';' after print statement");
        if (end == nullptr)
        {
            return nullptr;
        }

        statement->span = spanFrom(keyword, *end);
        return statement;
    }

    StatementPtr Parser::parseAssignment()
    {
        const Token& target = advance(); // consume identifier
        advance();                       // consume '='

        auto statement = std::make_unique<Statement>();
        statement->kind = StatementKind::Assign;
        statement->name = target.text;
        statement->headerSpan = target.span;
        statement->expression = parseExpression();
        if (!statement->expression)
        {
            return nullptr;
        }

        const Token* end = consume(TokenKind::Semicolon, "BAD-E2110", "';' after assignment");
        if (end == nullptr)
        {
            return nullptr;
        }

        statement->span = spanFrom(target, *end);
        return statement;
    }

    StatementPtr Parser::parseExpressionStatement()
    {
        auto statement = std::make_unique<Statement>();
        statement->kind = StatementKind::Expression;
        statement->expression = parseExpression();
        if (!statement->expression)
        {
            return nullptr;
        }

        const Token* end = consume(TokenKind::Semicolon, "BAD-E2110", "';' after expression");
        if (end == nullptr)
        {
            return nullptr;
        }

        statement->span = SourceSpan{statement->expression->span.begin, end->span.end};
        return statement;
    }

    ExpressionPtr Parser::parseExpression()
    {
        return parseOr();
    }

    ExpressionPtr Parser::makeBinary(Operator op, ExpressionPtr left, ExpressionPtr right) const
    {
        auto binary = std::make_unique<Expression>();
        binary->kind = ExpressionKind::Binary;
        binary->op = op;
        binary->span = mergeSpans(left->span, right->span);
        binary->left = std::move(left);
        binary->right = std::move(right);
        return binary;
    }

    ExpressionPtr Parser::parseOr()
    {
        ExpressionPtr left = parseAnd();
        while (left && match(TokenKind::PipePipe))
        {
            ExpressionPtr right = parseAnd();
            if (!right)
            {
                return nullptr;
            }
            left = makeBinary(Operator::Or, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionPtr Parser::parseAnd()
    {
        ExpressionPtr left = parseEquality();
        while (left && match(TokenKind::AmpersandAmpersand))
        {
            ExpressionPtr right = parseEquality();
            if (!right)
            {
                return nullptr;
            }
            left = makeBinary(Operator::And, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionPtr Parser::parseEquality()
    {
        ExpressionPtr left = parseComparison();
        while (left && (check(TokenKind::EqualsEquals) || check(TokenKind::BangEquals)))
        {
            const Operator op = advance().kind == TokenKind::EqualsEquals ? Operator::Equal : Operator::NotEqual;
            ExpressionPtr right = parseComparison();
            if (!right)
            {
                return nullptr;
            }
            left = makeBinary(op, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionPtr Parser::parseComparison()
    {
        ExpressionPtr left = parseTerm();
        while (left)
        {
            Operator op{};
            if (match(TokenKind::LessThan))
            {
                op = Operator::Less;
            }
            else if (match(TokenKind::LessEquals))
            {
                op = Operator::LessEqual;
            }
            else if (match(TokenKind::GreaterThan))
            {
                op = Operator::Greater;
            }
            else if (match(TokenKind::GreaterEquals))
            {
                op = Operator::GreaterEqual;
            }
            else
            {
                break;
            }

            ExpressionPtr right = parseTerm();
            if (!right)
            {
                return nullptr;
            }
            left = makeBinary(op, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionPtr Parser::parseTerm()
    {
        ExpressionPtr left = parseFactor();
        while (left && (check(TokenKind::Plus) || check(TokenKind::Minus)))
        {
            const Operator op = advance().kind == TokenKind::Plus ? Operator::Plus : Operator::Minus;
            ExpressionPtr right = parseFactor();
            if (!right)
            {
                return nullptr;
            }
            left = makeBinary(op, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionPtr Parser::parseFactor()
    {
        ExpressionPtr left = parseUnary();
        while (left)
        {
            Operator op{};
            if (match(TokenKind::Asterisk))
            {
                op = Operator::Multiply;
            }
            else if (match(TokenKind::Slash))
            {
                op = Operator::Divide;
            }
            else if (match(TokenKind::Percent))
            {
                op = Operator::Modulo;
            }
            else
            {
                break;
            }

            ExpressionPtr right = parseUnary();
            if (!right)
            {
                return nullptr;
            }
            left = makeBinary(op, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionPtr Parser::parseUnary()
    {
        if (check(TokenKind::Bang) || check(TokenKind::Minus) || check(TokenKind::Plus))
        {
            const Token& opToken = advance();
            ExpressionPtr operand = parseUnary();
            if (!operand)
            {
                return nullptr;
            }

            auto unary = std::make_unique<Expression>();
            unary->kind = ExpressionKind::Unary;
            switch (opToken.kind)
            {
            case TokenKind::Bang:
                unary->op = Operator::Not;
                break;
            case TokenKind::Minus:
                unary->op = Operator::Minus;
                break;
            default:
                unary->op = Operator::Plus;
                break;
            }
            unary->span = SourceSpan{opToken.span.begin, operand->span.end};
            unary->operand = std::move(operand);
            return unary;
        }

        return parsePrimary();
    }

    ExpressionPtr Parser::parsePrimary()
    {
        const Token& token = peek();
        switch (token.kind)
        {
        case TokenKind::IntegerLiteral:
        {
            advance();
            auto literal = std::make_unique<Expression>();
            literal->kind = ExpressionKind::Literal;
            literal->literalType = ScalarType::Integer;
            literal->span = token.span;
            const char* first = token.text.data();
            const auto result = std::from_chars(first, first + token.text.size(), literal->integerValue);
            if (result.ec != std::errc{})
            {
                fail("BAD-E2114", "Integer literal does not fit in a 32-bit word.", token.span);
                return nullptr;
            }
            return literal;
        }
        case TokenKind::KeywordTrue:
        case TokenKind::KeywordFalse:
        {
            advance();
            auto literal = std::make_unique<Expression>();
            literal->kind = ExpressionKind::Literal;
            literal->literalType = ScalarType::Boolean;
            literal->booleanValue = token.kind == TokenKind::KeywordTrue;
            literal->span = token.span;
            return literal;
        }
        case TokenKind::Identifier:
        {
            advance();
            if (check(TokenKind::LeftParen))
            {
                return parseCall(token);
            }

            auto variable = std::make_unique<Expression>();
            variable->kind = ExpressionKind::Variable;
            variable->name = token.text;
            variable->span = token.span;
            return variable;
        }
        case TokenKind::LeftParen:
        {
            advance();
            ExpressionPtr inner = parseExpression();
            if (!inner)
            {
                return nullptr;
            }
            const Token* close = consume(TokenKind::RightParen, "BAD-E2115", "')' after expression");
            if (close == nullptr)
            {
                return nullptr;
            }
            inner->span = spanFrom(token, *close);
            return inner;
        }
        default:
            fail("BAD-E2116", "expression", token);
            return nullptr;
        }
    }

    ExpressionPtr Parser::parseCall(const Token& callee)
    {
        advance(); // consume '('

        auto call = std::make_unique<Expression>();
        call->kind = ExpressionKind::Call;
        call->name = callee.text;

        if (!check(TokenKind::RightParen))
        {
            do
            {
                ExpressionPtr argument = parseExpression();
                if (!argument)
                {
                    return nullptr;
                }
                call->arguments.emplace_back(std::move(argument));
            } while (match(TokenKind::Comma));
        }

        const Token* close = consume(TokenKind::RightParen, "BAD-E2117", "')' after arguments");
        if (close == nullptr)
        {
            return nullptr;
        }

        call->span = spanFrom(callee, *close);
        return call;
    }
} // namespace badlang::frontend
