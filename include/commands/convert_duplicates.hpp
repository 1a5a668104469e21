#pragma once

int cmd_convert_duplicates(int argc, char** argv);
