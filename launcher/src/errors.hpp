#pragma once
#include <stdexcept>
#include <string>

// Malformed request or configuration; rejected before any network call.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

// Bump search exhausted or an invalid seed set. Integrity failure.
class DerivationError : public std::runtime_error {
public:
    explicit DerivationError(const std::string& what) : std::runtime_error(what) {}
};

class EncodingError : public std::runtime_error {
public:
    explicit EncodingError(const std::string& what) : std::runtime_error(what) {}
};

class FieldTooLarge : public EncodingError {
public:
    explicit FieldTooLarge(const std::string& what) : EncodingError(what) {}
};

class DecodeError : public EncodingError {
public:
    explicit DecodeError(const std::string& what) : EncodingError(what) {}
};

// Built instruction does not match the program's account-list schema.
class ContractViolation : public std::runtime_error {
public:
    explicit ContractViolation(const std::string& what) : std::runtime_error(what) {}
};

class CurveError : public std::runtime_error {
public:
    explicit CurveError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidReserves : public CurveError {
public:
    explicit InvalidReserves(const std::string& what) : CurveError(what) {}
};

class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

class AccountNotVisible : public NetworkError {
public:
    explicit AccountNotVisible(const std::string& what) : NetworkError(what) {}
};

class ConfirmationTimeout : public NetworkError {
public:
    explicit ConfirmationTimeout(const std::string& what) : NetworkError(what) {}
};

// Simulation or execution failure reported by the cluster.
class ProgramRejection : public std::runtime_error {
public:
    explicit ProgramRejection(const std::string& what) : std::runtime_error(what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};
