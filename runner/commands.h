#pragma once

int cmd_load(int argc, char** argv);
int cmd_run(int argc, char** argv);
int cmd_validate(int argc, char** argv);
int cmd_inspect(int argc, char** argv);
int cmd_watch(int argc, char** argv);
