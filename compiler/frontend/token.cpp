#include "token.hpp"

namespace badlang::frontend
{
    std::string_view toString(TokenKind kind)
    {
        switch (kind)
        {
        case TokenKind::EndOfFile: return "end of file";
        case TokenKind::Identifier: return "identifier";
        case TokenKind::IntegerLiteral: return "integer literal";

        case TokenKind::KeywordFun: return "fun";
        case TokenKind::KeywordInt: return "int";
        case TokenKind::KeywordBool: return "bool";
        case TokenKind::KeywordTrue: return "true";
        case TokenKind::KeywordFalse: return "false";
        case TokenKind::KeywordIf: return "if";
        case TokenKind::KeywordElse: return "else";
        case TokenKind::KeywordWhile: return "while";
        case TokenKind::KeywordReturn: return "return";
        case TokenKind::KeywordPrint: return "print";
        case TokenKind::KeywordPrintSpace: return "printsp";
        case TokenKind::KeywordPrintLine: return "println";

        case TokenKind::LeftBrace: return "{";
        case TokenKind::RightBrace: return "}";
        case TokenKind::LeftParen: return "(";
        case TokenKind::RightParen: return ")";
        case TokenKind::Comma: return ",";
        case TokenKind::Semicolon: return ";";
        case TokenKind::Equals: return "=";
        case TokenKind::Plus: return "+";
        case TokenKind::Minus: return "-";
        case TokenKind::Asterisk: return "*";
        case TokenKind::Slash: return "/";
        case TokenKind::Percent: return "%";
        case TokenKind::Bang: return "!";
        case TokenKind::AmpersandAmpersand: return "&&";
        case TokenKind::PipePipe: return "||";
        case TokenKind::LessThan: return "<";
        case TokenKind::GreaterThan: return ">";
        case TokenKind::LessEquals: return "<=";
        case TokenKind::GreaterEquals: return ">=";
        case TokenKind::EqualsEquals: return "==";
        case TokenKind::BangEquals: return "!=";
        }

        return "unknown";
    }
} // namespace badlang::frontend
