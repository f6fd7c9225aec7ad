#pragma once
#include <cstdint>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace packwerk {

// Категории ошибок конвейера.
enum class ErrorKind : uint8_t {
  Conversion,    // размер не влезает в целевой тип, всегда дефект
  Backend,       // сбой чтения/записи на стороне хранилища (без ретраев)
  Verification,  // self-verify или несовпадение длины после распаковки
  Crypto,        // ошибка шифрования/расшифровки (в т.ч. неверный тег)
  Format,        // битый заголовок пака / индекс-файла
  Internal       // конвейер уже завершён, неожиданное закрытие очереди
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what);

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Текст сохранённого исключения для логов.
std::string describe(std::exception_ptr e);

// Checked narrowing used for every on-disk u32 field.
template <typename To, typename From>
To narrow(From v, const char* what) {
  bool bad = false;
  if constexpr (std::is_signed_v<From>) bad = v < 0;
  if (bad || static_cast<uint64_t>(v) > std::numeric_limits<To>::max()) {
    throw Error(ErrorKind::Conversion,
                std::string(what) + ": value " + std::to_string(v) + " does not fit");
  }
  return static_cast<To>(v);
}

} // namespace packwerk
