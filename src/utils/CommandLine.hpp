#pragma once

class CommandLine {
   public:
    using argv_type = char* const*;
    using argc_type = int;

   private:
    argc_type _argc;
    argv_type _argv;

   public:
    // Throws std::invalid_argument if argv or argv[0] is null.
    CommandLine(argc_type argc, argv_type argv);
    [[nodiscard]] argv_type argv() const;
    [[nodiscard]] argc_type argc() const;
};
