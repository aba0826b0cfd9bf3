#pragma once
enum class ErrorCode {
  OK,
  SyntaxError,
  DataTooLarge,
  IOError,
  FileNotOpen,
};

enum class StatementType {
  Empty,
  Add,
  Remove,
  Clear,
  Contains,
  Valid,
  Freq,
  Prefix,
  Complete,
  Force,
  Words,
  Dump,
  Load,
  Help,
};
