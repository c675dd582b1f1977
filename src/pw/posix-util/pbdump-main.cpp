// pbdump-main.cpp - print protocol buffer wire data as text
#include "pw/posix-util/pbdump.hpp"
#include <stdio.h>

static int stdout_putchar(char ch) { return pwputchar(ch); }

int main(int argc, char *argv[]) {
  int status = pbdump_run(argc, argv, stdout_putchar);
  fflush(stdout);
  return status;
}
