#pragma once

enum class EngineErrc
{
    // General Errors
    UnknownError,
    OutputFileWriteFailed,

    // Registry Errors
    EvaluatorAlreadyRegistered,
    EvaluatorNotRegistered,

    // Payload Errors
    UnknownContractType,
    UnknownEvaluationMode,
    UnknownDemandType,
    UnknownDistributionType,

    // I/O Errors
    PayloadFileNotFound,
    PayloadParseError,
    PayloadConfigError
};
