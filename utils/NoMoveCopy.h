#pragma once

// Base for types that own a handle (regex, stream, thread) which must not
// be duplicated or transferred
class NoMoveCopy
{
public:
  NoMoveCopy() = default;

protected:
  NoMoveCopy(const NoMoveCopy &other) = delete;
  NoMoveCopy &operator=(const NoMoveCopy &other) = delete;
  NoMoveCopy &operator=(NoMoveCopy &&other) noexcept = delete;
  NoMoveCopy(NoMoveCopy &&other) noexcept = delete;
};
