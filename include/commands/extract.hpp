#pragma once

int cmd_extract(int argc, char** argv);
int cmd_rake(int argc, char** argv);
